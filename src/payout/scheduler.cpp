#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <disburse/payout/scheduler.hpp>
#include <algorithm>

using namespace disburse::schema;

namespace disburse::payout {

namespace {

operation_result<payout_batch_t> already_scheduled(
    const std::string_view escrow_id,
    const std::string_view batch_id) {
  return make_failure<payout_batch_t>(
      error_code::already_scheduled, kCodespace,
      fmt::format("escrow {} already has payout batch {}", escrow_id,
                  batch_id));
}

}  // namespace

scheduler::scheduler(storage::state_store& store,
                     const split::calculator& calculator,
                     ports::job_queue_port& jobs,
                     ports::notification_port& notifications,
                     ports::event_publisher_port& events,
                     ports::id_generator_t ids,
                     ports::time_source_t clock,
                     const placeholder_policy_t policy)
    : store_{store},
      calculator_{calculator},
      jobs_{jobs},
      notifications_{notifications},
      events_{events},
      ids_{std::move(ids)},
      clock_{std::move(clock)},
      policy_{policy} {}

placeholder_policy_t scheduler::policy() const {
  return policy_;
}

operation_result<payout_batch_t> scheduler::schedule(
    const schedule_request& request) {
  auto existing = store_.find_batch_by_escrow(request.escrow_id);
  if (existing && !is_orphaned(*existing)) {
    spdlog::warn("Payout for escrow {} already scheduled as {}",
                 request.escrow_id, existing->batch_id);
    return already_scheduled(request.escrow_id, existing->batch_id);
  }

  auto escrow = store_.find_escrow(request.escrow_id);
  if (!escrow) {
    return make_failure<payout_batch_t>(
        error_code::escrow_not_found, kCodespace,
        fmt::format("escrow {} does not exist", request.escrow_id));
  }
  if (escrow->status != escrow_status_t::released) {
    return make_failure<payout_batch_t>(
        error_code::invalid_transition, kCodespace,
        fmt::format("escrow {} is {}, payouts need a released escrow",
                    escrow->escrow_id, to_string(escrow->status)));
  }
  // The batch always splits exactly what the escrow holds.
  if (request.amount != escrow->amount) {
    spdlog::warn("Payout request for escrow {} asks for {}, escrow holds {}",
                 escrow->escrow_id, request.amount, escrow->amount);
    return make_failure<payout_batch_t>(
        error_code::invalid_amount, kCodespace,
        fmt::format("escrow {} holds {} {}, not {}", escrow->escrow_id,
                    format_amount(escrow->amount), escrow->currency,
                    format_amount(request.amount)));
  }
  if (request.currency != escrow->currency) {
    return make_failure<payout_batch_t>(
        error_code::invalid_currency, kCodespace,
        fmt::format("escrow {} is in {}, not {}", escrow->escrow_id,
                    escrow->currency, request.currency));
  }
  if (request.project_id != escrow->project_id) {
    return make_failure<payout_batch_t>(
        error_code::invalid_argument, kCodespace,
        fmt::format("escrow {} belongs to project {}", escrow->escrow_id,
                    escrow->project_id));
  }
  if (existing) {
    return recover(*existing);
  }

  auto project = store_.find_project(escrow->project_id);
  if (!project) {
    return make_failure<payout_batch_t>(
        error_code::project_not_found, kCodespace,
        fmt::format("project {} does not exist", escrow->project_id));
  }

  auto settled = calculator_.settle(escrow->amount, escrow->currency,
                                    project->splits, policy_);
  if (!settled.ok()) {
    spdlog::warn("Cannot schedule payout for escrow {}: {} {}",
                 request.escrow_id, settled.log, settled.info);
    return forward_failure<payout_batch_t>(settled);
  }
  const auto& settlement = *settled.value;

  auto now = clock_();
  auto batch = payout_batch_t{};
  batch.batch_id = ids_("pob");
  batch.escrow_id = escrow->escrow_id;
  batch.project_id = escrow->project_id;
  batch.milestone_id = request.milestone_id;
  batch.currency = escrow->currency;
  batch.gross_amount = escrow->amount;
  batch.platform_fee = settlement.breakdown.platform_fee;
  batch.withheld_amount = settlement.withheld_amount;
  batch.placeholder_policy = settlement.policy;
  batch.status = payout_status_t::scheduled;
  batch.created_at = now;
  batch.updated_at = now;
  for (const auto& share : settlement.breakdown.shares) {
    auto item = payout_item_t{};
    item.recipient_id = *share.recipient_id;
    item.percentage = share.percentage;
    item.gross_share = share.gross_share;
    item.fee_share = share.platform_fee_share;
    item.tax_withheld = share.tax_withheld;
    item.net_amount = share.net_amount;
    batch.total_net += share.net_amount;
    batch.items.push_back(std::move(item));
  }

  auto status = storage::write_one(store_, storage::write_mode_t::insert, batch);
  if (status == storage::write_status_t::batch_already_exists) {
    auto winner = store_.find_batch_by_escrow(request.escrow_id);
    spdlog::warn("Lost payout scheduling race for escrow {}",
                 request.escrow_id);
    return already_scheduled(request.escrow_id,
                             winner ? winner->batch_id : std::string{"?"});
  }
  if (status != storage::write_status_t::ok) {
    spdlog::error("Failed to persist payout batch for escrow {}: {}",
                  request.escrow_id, storage::to_string(status));
    return make_failure<payout_batch_t>(
        error_code::version_conflict, kCodespace,
        std::string{storage::to_string(status)});
  }
  spdlog::info(
      "Scheduled payout batch {} for escrow {}: {} item(s), net {} {}, fee "
      "{}, withheld {}",
      batch.batch_id, batch.escrow_id, batch.items.size(), batch.total_net,
      batch.currency, batch.platform_fee, batch.withheld_amount);

  auto launched = launch(std::move(batch), false);
  if (launched.ok()) {
    announce_scheduled(*launched.value);
  }
  return launched;
}

operation_result<payout_batch_t> scheduler::resume(
    const std::string_view batch_id) {
  auto batch = store_.find_batch(batch_id);
  if (!batch) {
    return make_failure<payout_batch_t>(
        error_code::batch_not_found, kCodespace,
        fmt::format("payout batch {} does not exist", batch_id));
  }
  if (batch->status == payout_status_t::paid ||
      batch->status == payout_status_t::failed) {
    return make_success(std::move(*batch), kCodespace);
  }
  auto unpaid = std::ranges::any_of(batch->items, [](const auto& item) {
    return item.status == payout_status_t::scheduled ||
           item.status == payout_status_t::failed;
  });
  if (!unpaid) {
    return make_success(std::move(*batch), kCodespace);
  }
  if (batch->job_id) {
    auto job = jobs_.find(*batch->job_id);
    if (job && job->status == job_status_t::queued) {
      return make_success(std::move(*batch), kCodespace);
    }
  }

  spdlog::info("Payout batch {} has unpaid items and no queued job, "
               "enqueueing a retry",
               batch->batch_id);
  return launch(std::move(*batch), true);
}

bool scheduler::is_orphaned(const payout_batch_t& batch) {
  return batch.status == payout_status_t::failed && !batch.job_id;
}

operation_result<payout_batch_t> scheduler::recover(
    const payout_batch_t& orphan) {
  auto claimed = storage::modify<payout_batch_t>(
      store_, [&] { return store_.find_batch(orphan.batch_id); },
      [&](payout_batch_t& current) {
        if (!is_orphaned(current)) {
          return false;
        }
        current.status = derive_batch_status(current);
        current.updated_at = clock_();
        return true;
      });
  if (!claimed) {
    return already_scheduled(orphan.escrow_id, orphan.batch_id);
  }
  spdlog::info("Recovering payout batch {} for escrow {}", claimed->batch_id,
               claimed->escrow_id);
  auto launched = launch(std::move(*claimed), true);
  if (launched.ok()) {
    announce_scheduled(*launched.value);
  }
  return launched;
}

operation_result<payout_batch_t> scheduler::launch(payout_batch_t batch,
                                                   const bool is_retry) {
  auto payload = job_payload_t{
      {"batch_id", payload_value_t{batch.batch_id}},
      {"escrow_id", payload_value_t{batch.escrow_id}},
      {"is_retry", payload_value_t{is_retry}}};
  auto job = jobs_.enqueue(kExecuteJobType, std::move(payload));
  if (!job.ok()) {
    spdlog::error("Payout batch {} has no execution job: {} {}",
                  batch.batch_id, job.log, job.info);
    if (!batch.job_id) {
      abandon(batch);
    }
    return make_failure<payout_batch_t>(
        error_code::job_not_enqueued, kCodespace,
        fmt::format("payout batch {} stored but its job was not enqueued: {}",
                    batch.batch_id, job.info));
  }

  const auto& job_id = job.value->job_id;
  auto linked = storage::modify<payout_batch_t>(
      store_, [&] { return store_.find_batch(batch.batch_id); },
      [&](payout_batch_t& current) {
        current.job_id = job_id;
        current.updated_at = clock_();
        return true;
      });
  if (linked) {
    return make_success(std::move(*linked), kCodespace);
  }
  spdlog::error("Payout batch {} runs as job {} but the link was not stored",
                batch.batch_id, job_id);
  batch.job_id = job_id;
  auto result = make_success(std::move(batch), kCodespace);
  result.info = fmt::format("job {} is not linked on the stored batch", job_id);
  return result;
}

void scheduler::abandon(const payout_batch_t& batch) {
  auto marked = storage::modify<payout_batch_t>(
      store_, [&] { return store_.find_batch(batch.batch_id); },
      [&](payout_batch_t& current) {
        if (current.job_id) {
          return false;
        }
        current.status = payout_status_t::failed;
        current.updated_at = clock_();
        return true;
      });
  if (!marked) {
    spdlog::error("Could not mark payout batch {} failed", batch.batch_id);
    return;
  }
  events_.publish("payout.failed",
                  {{"batch_id", batch.batch_id},
                   {"reason", std::string{"execution job not enqueued"}}});
}

void scheduler::announce_scheduled(const payout_batch_t& batch) {
  for (const auto& item : batch.items) {
    notifications_.notify(
        item.recipient_id, "payout.scheduled",
        fmt::format("A payout of {} {} has been scheduled",
                    format_amount(item.net_amount), batch.currency));
  }
  events_.publish("payout.scheduled",
                  {{"batch_id", batch.batch_id},
                   {"escrow_id", batch.escrow_id},
                   {"job_id", batch.job_id.value_or(std::string{})},
                   {"total_net", std::to_string(batch.total_net)}});
}

}  // namespace disburse::payout
