#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <disburse/payout/executor.hpp>
#include <algorithm>
#include <exception>

using namespace disburse::schema;

namespace disburse::payout {

namespace {

bool is_final_attempt(const job_t& job) {
  return job.attempt + 1 >= job.max_attempts;
}

bool needs_transfer(const payout_item_t& item) {
  return item.status == payout_status_t::scheduled ||
         item.status == payout_status_t::failed;
}

payout_status_t to_item_status(const ports::psp_status_t status) {
  switch (status) {
    case ports::psp_status_t::succeeded:
      return payout_status_t::paid;
    case ports::psp_status_t::pending:
      return payout_status_t::processing;
    case ports::psp_status_t::failed:
      break;
  }
  return payout_status_t::failed;
}

}  // namespace

executor::executor(storage::state_store& store,
                   ports::psp_gateway& gateway,
                   ports::notification_port& notifications,
                   ports::event_publisher_port& events,
                   ports::time_source_t clock)
    : store_{store},
      gateway_{gateway},
      notifications_{notifications},
      events_{events},
      clock_{std::move(clock)} {}

std::string executor::transfer_key(const payout_batch_t& batch,
                                   const std::size_t index) {
  const auto round = batch.items.at(index).transfer_round;
  if (round == 0) {
    return fmt::format("{}:{}", batch.batch_id, index);
  }
  return fmt::format("{}:{}:{}", batch.batch_id, index, round);
}

jobs::handler_result executor::operator()(const job_t& job,
                                          std::stop_token stop) {
  auto batch_id = payload_string(job.payload, "batch_id");
  if (!batch_id) {
    return {jobs::handler_status_t::permanent_failure, "batch_id missing"};
  }
  auto batch = store_.find_batch(*batch_id);
  if (!batch) {
    spdlog::error("Payout job {} references unknown batch {}", job.job_id,
                  *batch_id);
    return {jobs::handler_status_t::permanent_failure,
            fmt::format("batch {} not found", *batch_id)};
  }

  auto escrow = store_.find_escrow(batch->escrow_id);
  if (!escrow) {
    return abort_batch(*batch, fmt::format("escrow {} not found",
                                           batch->escrow_id));
  }
  if (escrow->status != escrow_status_t::released) {
    return abort_batch(*batch,
                       fmt::format("escrow {} is {}", escrow->escrow_id,
                                   to_string(escrow->status)));
  }

  spdlog::info("Executing payout batch {} (job {}, attempt {}/{}{})",
               batch->batch_id, job.job_id, job.attempt + 1, job.max_attempts,
               payload_bool(job.payload, "is_retry").value_or(false)
                   ? ", retry"
                   : "");
  for (std::size_t i = 0; i < batch->items.size(); ++i) {
    if (stop.stop_requested()) {
      return {jobs::handler_status_t::retry, "stopped before completion"};
    }
    if (!needs_transfer(batch->items[i])) {
      continue;
    }
    transfer_item(*batch, escrow->provider_reference, i);
  }

  batch = store_.find_batch(*batch_id);
  if (!batch) {
    return {jobs::handler_status_t::permanent_failure,
            fmt::format("batch {} vanished", *batch_id)};
  }
  auto failed = std::ranges::count_if(batch->items, [](const auto& item) {
    return item.status == payout_status_t::failed;
  });
  if (failed == 0) {
    if (batch->status == payout_status_t::paid) {
      announce_paid(*batch);
    } else {
      spdlog::info("Payout batch {} awaiting transfer confirmations",
                   batch->batch_id);
    }
    return {jobs::handler_status_t::succeeded, {}};
  }

  auto message = fmt::format("{} of {} transfer(s) failed", failed,
                             batch->items.size());
  if (is_final_attempt(job)) {
    fail_batch(*batch_id, message);
  } else {
    spdlog::warn("Payout batch {}: {}, retrying", *batch_id, message);
  }
  return {jobs::handler_status_t::retry, message};
}

void executor::transfer_item(const payout_batch_t& batch,
                             const std::string& provider_payment_id,
                             const std::size_t index) {
  const auto& item = batch.items[index];
  auto request = ports::transfer_request{};
  request.provider_payment_id = provider_payment_id;
  request.recipient_id = item.recipient_id;
  request.amount = item.net_amount;
  request.currency = batch.currency;
  request.idempotency_key = transfer_key(batch, index);

  auto response = ports::transfer_response{};
  // Only an answer from the provider settles the key. A transport error
  // leaves the outcome unknown, so the retry reuses it.
  auto answered = true;
  try {
    response = gateway_.capture_and_transfer(request);
  } catch (const std::exception& ex) {
    spdlog::warn("Transfer {} to {} failed: {}", request.idempotency_key,
                 item.recipient_id, ex.what());
    answered = false;
    response.status = ports::psp_status_t::failed;
    response.failure_reason = ex.what();
  }

  auto stored = storage::modify<payout_batch_t>(
      store_, [&] { return store_.find_batch(batch.batch_id); },
      [&](payout_batch_t& current) {
        auto& target = current.items.at(index);
        if (target.status == payout_status_t::paid) {
          return false;
        }
        target.attempts += 1;
        target.status = to_item_status(response.status);
        if (answered && target.status == payout_status_t::failed) {
          target.transfer_round += 1;
        }
        if (!response.provider_transfer_id.empty()) {
          target.provider_transfer_id = response.provider_transfer_id;
        }
        target.failure_reason = response.failure_reason;
        current.status = derive_batch_status(current);
        current.updated_at = clock_();
        return true;
      });
  if (!stored) {
    spdlog::error("Could not record transfer {} on batch {}",
                  request.idempotency_key, batch.batch_id);
    return;
  }
  spdlog::info("Payout item {} of batch {} -> {} ({} {})", index,
               batch.batch_id, to_string(stored->items.at(index).status),
               format_amount(item.net_amount), batch.currency);
}

void executor::give_up(const job_t& job) {
  auto batch_id = payload_string(job.payload, "batch_id");
  if (!batch_id) {
    return;
  }
  fail_batch(*batch_id, job.last_error.empty()
                            ? std::string{"job dead-lettered"}
                            : job.last_error);
}

void executor::fail_batch(const std::string& batch_id,
                          const std::string& reason) {
  auto marked = storage::modify<payout_batch_t>(
      store_, [&] { return store_.find_batch(batch_id); },
      [&](payout_batch_t& current) {
        if (current.status == payout_status_t::paid ||
            current.status == payout_status_t::failed) {
          return false;
        }
        current.status = payout_status_t::failed;
        current.updated_at = clock_();
        return true;
      });
  if (!marked) {
    auto current = store_.find_batch(batch_id);
    if (!current || (current->status != payout_status_t::paid &&
                     current->status != payout_status_t::failed)) {
      spdlog::error("Could not mark payout batch {} failed", batch_id);
    }
    return;
  }
  spdlog::error("Payout batch {} failed for good: {}", batch_id, reason);
  events_.publish("payout.failed", {{"batch_id", batch_id}, {"reason", reason}});
}

jobs::handler_result executor::abort_batch(const payout_batch_t& batch,
                                           const std::string& reason) {
  spdlog::warn("Aborting payout batch {}: {}", batch.batch_id, reason);
  auto aborted = storage::modify<payout_batch_t>(
      store_, [&] { return store_.find_batch(batch.batch_id); },
      [&](payout_batch_t& current) {
        for (auto& item : current.items) {
          if (item.status == payout_status_t::paid) {
            continue;
          }
          item.status = payout_status_t::failed;
          item.failure_reason = reason;
        }
        current.status = payout_status_t::failed;
        current.updated_at = clock_();
        return true;
      });
  if (!aborted) {
    spdlog::error("Could not mark payout batch {} aborted", batch.batch_id);
  }
  events_.publish("payout.aborted",
                  {{"batch_id", batch.batch_id}, {"reason", reason}});
  return {jobs::handler_status_t::permanent_failure, reason};
}

void executor::announce_paid(const payout_batch_t& batch) {
  spdlog::info("Payout batch {} fully paid: {} {}", batch.batch_id,
               format_amount(batch.total_net), batch.currency);
  for (const auto& item : batch.items) {
    notifications_.notify(
        item.recipient_id, "payout.paid",
        fmt::format("Your payout of {} {} has been sent",
                    format_amount(item.net_amount), batch.currency));
  }
  events_.publish("payout.paid", {{"batch_id", batch.batch_id},
                                  {"escrow_id", batch.escrow_id},
                                  {"total_net",
                                   std::to_string(batch.total_net)}});
}

}  // namespace disburse::payout
