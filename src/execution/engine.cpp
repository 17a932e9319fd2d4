#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <disburse/execution/engine.hpp>

using namespace disburse::schema;

namespace disburse::execution {

namespace {

const auto kDrainWorker = std::string{"inline"};

}  // namespace

engine::engine(config::engine_config config, engine_ports ports)
    : config_{std::move(config)},
      store_{ports.store},
      notifications_{ports.notifications},
      access_{ports.access},
      clock_{ports.clock},
      ids_{ports.ids},
      calculator_{config_.fee_rate_bps},
      registry_{jobs::make_default_registry()},
      queue_{registry_,          ports.clock,        ports.ids,
             ports.random,       config_.backoff,    config_.lease_grace,
             config_.default_priority},
      ledger_{ports.store, ports.clock, ports.ids},
      milestones_{ports.store,         ledger_,      ports.access, queue_,
                  ports.notifications, ports.events, ports.clock},
      scheduler_{ports.store,  calculator_, queue_,
                 ports.notifications, ports.events, ports.ids,
                 ports.clock,  config_.placeholder_policy},
      reconciler_{ports.store,         milestones_,  scheduler_,
                  ports.notifications, ports.events, ports.clock,
                  std::move(ports.verifier)},
      intents_{ports.store, ports.gateway, ports.events, ports.ids,
               ports.clock},
      payouts_{ports.store, ports.gateway, ports.notifications, ports.events,
               ports.clock},
      refunds_{ports.store, ports.gateway, ports.events, ports.clock},
      runner_{queue_, config_.worker_count, config_.poll_interval} {
  runner_.register_handler(
      std::string{payout::kExecuteJobType},
      [this](const job_t& job, std::stop_token stop) {
        return payouts_(job, std::move(stop));
      });
  runner_.register_handler(
      std::string{milestone::kRefundJobType},
      [this](const job_t& job, std::stop_token stop) {
        return refunds_(job, std::move(stop));
      });
  queue_.on_dead_letter(std::string{payout::kExecuteJobType},
                        [this](const job_t& job) { payouts_.give_up(job); });
  spdlog::info(
      "Settlement engine ready: fee {} bps, placeholder policy {}, {} "
      "worker(s)",
      config_.fee_rate_bps, to_string(config_.placeholder_policy),
      config_.worker_count);
}

engine::~engine() {
  runner_.stop();
}

operation_result<project_t> engine::create_project(
    std::string_view owner_id,
    std::vector<entity_id_t> member_ids,
    std::vector<revenue_split_t> splits) {
  if (owner_id.empty()) {
    return make_failure<project_t>(error_code::invalid_argument, kCodespace,
                                   "owner id is required");
  }
  auto valid = calculator_.validate(splits);
  if (!valid.ok()) {
    spdlog::warn("Rejected split set for new project: {} {}", valid.log,
                 valid.info);
    return forward_failure<project_t>(valid);
  }

  auto project = project_t{};
  project.project_id = ids_("prj");
  project.owner_id = std::string{owner_id};
  project.member_ids = std::move(member_ids);
  project.splits = std::move(splits);
  project.created_at = clock_();
  project.updated_at = project.created_at;
  auto status = storage::write_one(store_, storage::write_mode_t::insert, project);
  if (status != storage::write_status_t::ok) {
    spdlog::error("Failed to store project {}: {}", project.project_id,
                  storage::to_string(status));
    return make_failure<project_t>(error_code::version_conflict, kCodespace,
                                   std::string{storage::to_string(status)});
  }
  spdlog::info("Created project {} for owner {} with {} split row(s)",
               project.project_id, project.owner_id, project.splits.size());
  return make_success(std::move(project), kCodespace);
}

operation_result<project_t> engine::replace_splits(
    std::string_view project_id,
    std::string_view actor_id,
    const uint64_t expected_revision,
    std::vector<revenue_split_t> splits) {
  auto project = store_.find_project(project_id);
  if (!project) {
    return make_failure<project_t>(
        error_code::project_not_found, kCodespace,
        fmt::format("project {} does not exist", project_id));
  }
  if (!access_.is_owner(*project, actor_id)) {
    return make_failure<project_t>(
        error_code::permission_denied, kCodespace,
        fmt::format("{} does not own project {}", actor_id, project_id));
  }
  auto valid = calculator_.validate(splits);
  if (!valid.ok()) {
    return forward_failure<project_t>(valid);
  }
  if (project->revision != expected_revision) {
    return make_failure<project_t>(
        error_code::version_conflict, kCodespace,
        fmt::format("project {} is at revision {}, not {}", project_id,
                    project->revision, expected_revision));
  }

  project->splits = std::move(splits);
  project->updated_at = clock_();
  auto status =
      storage::write_one(store_, storage::write_mode_t::update, *project);
  if (status != storage::write_status_t::ok) {
    spdlog::warn("Split replacement for project {} lost a race: {}",
                 project_id, storage::to_string(status));
    return make_failure<project_t>(error_code::version_conflict, kCodespace,
                                   std::string{storage::to_string(status)});
  }
  spdlog::info("Project {} split set replaced (revision {})", project_id,
               project->revision);
  return make_success(std::move(*project), kCodespace);
}

operation_result<milestone_t> engine::create_milestone(
    std::string_view project_id,
    std::string_view actor_id,
    std::string title,
    const amount_t amount,
    std::string_view currency) {
  auto project = store_.find_project(project_id);
  if (!project) {
    return make_failure<milestone_t>(
        error_code::project_not_found, kCodespace,
        fmt::format("project {} does not exist", project_id));
  }
  if (!access_.is_owner(*project, actor_id)) {
    return make_failure<milestone_t>(
        error_code::permission_denied, kCodespace,
        fmt::format("{} does not own project {}", actor_id, project_id));
  }
  if (amount <= 0) {
    return make_failure<milestone_t>(
        error_code::invalid_amount, kCodespace,
        fmt::format("milestone amount must be positive, got {}", amount));
  }
  if (!is_valid_currency(currency)) {
    return make_failure<milestone_t>(
        error_code::invalid_currency, kCodespace,
        fmt::format("'{}' is not a currency code", currency));
  }

  auto milestone = milestone_t{};
  milestone.milestone_id = ids_("ms");
  milestone.project_id = project->project_id;
  milestone.title = std::move(title);
  milestone.amount = amount;
  milestone.currency = std::string{currency};
  milestone.status = milestone_status_t::pending;
  milestone.created_at = clock_();
  milestone.updated_at = milestone.created_at;
  auto status =
      storage::write_one(store_, storage::write_mode_t::insert, milestone);
  if (status != storage::write_status_t::ok) {
    spdlog::error("Failed to store milestone {}: {}", milestone.milestone_id,
                  storage::to_string(status));
    return make_failure<milestone_t>(error_code::version_conflict, kCodespace,
                                     std::string{storage::to_string(status)});
  }
  spdlog::info("Created milestone {} '{}' ({} {}) on project {}",
               milestone.milestone_id, milestone.title,
               format_amount(milestone.amount), milestone.currency,
               milestone.project_id);
  return make_success(std::move(milestone), kCodespace);
}

operation_result<split_breakdown_t> engine::calculate_split(
    const amount_t amount,
    std::string_view currency,
    const std::vector<revenue_split_t>& splits) const {
  return calculator_.calculate(amount, currency, splits);
}

operation_result<payout_batch_t> engine::schedule_payouts(
    const payout::schedule_request& request) {
  auto scheduled = scheduler_.schedule(request);
  if (scheduled.ok()) {
    runner_.notify();
  }
  return scheduled;
}

operation_result<milestone::transition_t> engine::complete_milestone(
    std::string_view milestone_id,
    std::string_view actor_id) {
  return milestones_.complete(milestone_id, actor_id);
}

operation_result<milestone::transition_t> engine::approve_milestone(
    std::string_view milestone_id,
    std::string_view actor_id) {
  auto approved = milestones_.approve(milestone_id, actor_id);
  if (!approved.ok() || !approved.value->escrow) {
    return approved;
  }

  const auto& escrow = *approved.value->escrow;
  auto request = payout::schedule_request{};
  request.escrow_id = escrow.escrow_id;
  request.project_id = escrow.project_id;
  request.milestone_id = escrow.milestone_id;
  request.amount = escrow.amount;
  request.currency = escrow.currency;
  auto scheduled = schedule_payouts(request);
  if (scheduled.ok()) {
    approved.info = fmt::format("payout batch {} scheduled",
                                scheduled.value->batch_id);
  } else {
    spdlog::error("Escrow {} released but payouts were not scheduled: {} {}",
                  escrow.escrow_id, scheduled.log, scheduled.info);
    approved.info = fmt::format("payout scheduling failed: {} {}",
                                scheduled.log, scheduled.info);
  }
  return approved;
}

operation_result<milestone::transition_t> engine::dispute_milestone(
    std::string_view milestone_id,
    std::string_view actor_id,
    std::string_view reason) {
  return milestones_.dispute(milestone_id, actor_id, reason);
}

operation_result<milestone::transition_t> engine::reject_milestone(
    std::string_view milestone_id,
    std::string_view actor_id,
    std::string_view reason) {
  auto rejected = milestones_.reject(milestone_id, actor_id, reason);
  if (rejected.ok()) {
    runner_.notify();
  }
  return rejected;
}

operation_result<milestone::transition_t> engine::resolve_dispute(
    std::string_view milestone_id,
    std::string_view actor_id) {
  return milestones_.resolve(milestone_id, actor_id);
}

operation_result<job_t> engine::requeue_refund(std::string_view milestone_id,
                                               std::string_view actor_id) {
  auto requeued = milestones_.requeue_refund(milestone_id, actor_id);
  if (requeued.ok()) {
    runner_.notify();
  }
  return requeued;
}

operation_result<payment::intent_t> engine::create_payment_intent(
    std::string_view project_id,
    std::string_view milestone_id,
    std::string_view payer_id,
    std::string_view provider) {
  return intents_.create(project_id, milestone_id, payer_id, provider);
}

operation_result<webhook::reconciliation_t> engine::receive_webhook(
    std::string_view provider,
    std::string_view raw_body,
    std::string_view signature) {
  return reconciler_.receive(provider, raw_body, signature);
}

std::size_t engine::run_pending_jobs() {
  return runner_.drain(kDrainWorker);
}

void engine::start_workers() {
  runner_.start();
}

void engine::stop_workers() {
  runner_.stop();
}

operation_result<job_t> engine::requeue_dead_letter(std::string_view job_id) {
  auto requeued = queue_.requeue_dead_letter(job_id);
  if (requeued.ok()) {
    runner_.notify();
  }
  return requeued;
}

std::vector<job_t> engine::list_jobs(
    std::optional<job_status_t> status) const {
  return queue_.list(status);
}

const storage::state_store& engine::store() const {
  return store_;
}

const config::engine_config& engine::configuration() const {
  return config_;
}

}  // namespace disburse::execution
