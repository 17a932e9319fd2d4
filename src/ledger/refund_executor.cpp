#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <disburse/ledger/refund_executor.hpp>

using namespace disburse::schema;

namespace disburse::ledger {

refund_executor::refund_executor(storage::state_store& store,
                                 ports::psp_gateway& gateway,
                                 ports::event_publisher_port& events,
                                 ports::time_source_t clock)
    : store_{store},
      gateway_{gateway},
      events_{events},
      clock_{std::move(clock)} {}

jobs::handler_result refund_executor::operator()(const job_t& job,
                                                 std::stop_token stop) {
  auto escrow_id = payload_string(job.payload, "escrow_id");
  if (!escrow_id) {
    return {jobs::handler_status_t::permanent_failure, "escrow_id missing"};
  }
  auto escrow = store_.find_escrow(*escrow_id);
  if (!escrow) {
    return {jobs::handler_status_t::permanent_failure,
            fmt::format("escrow {} not found", *escrow_id)};
  }
  if (escrow->status != escrow_status_t::refunded) {
    spdlog::error("Refund job {} found escrow {} {}", job.job_id,
                  escrow->escrow_id, to_string(escrow->status));
    return {jobs::handler_status_t::permanent_failure,
            fmt::format("escrow {} is {}", escrow->escrow_id,
                        to_string(escrow->status))};
  }
  if (stop.stop_requested()) {
    return {jobs::handler_status_t::retry, "stopped before refund"};
  }

  auto request = ports::refund_request{};
  request.provider_payment_id = escrow->provider_reference;
  request.amount = escrow->amount;
  request.reason = payload_string(job.payload, "reason").value_or("");
  request.idempotency_key = fmt::format("refund:{}", escrow->escrow_id);
  auto response = gateway_.refund(request);
  if (response.status == ports::psp_status_t::failed) {
    return {jobs::handler_status_t::retry,
            fmt::format("provider rejected refund of {}", escrow->escrow_id)};
  }

  auto refunded = storage::modify<payment_transaction_t>(
      store_, [&] { return store_.find_transaction(escrow->transaction_id); },
      [&](payment_transaction_t& tx) {
        if (tx.status == transaction_status_t::refunded) {
          return false;
        }
        tx.status = transaction_status_t::refunded;
        tx.updated_at = clock_();
        return true;
      });
  if (!refunded) {
    spdlog::warn("Transaction {} not marked refunded",
                 escrow->transaction_id);
  }
  spdlog::info("Refunded escrow {}: {} {} ({})", escrow->escrow_id,
               format_amount(escrow->amount), escrow->currency,
               response.provider_refund_id);
  events_.publish("escrow.refunded",
                  {{"escrow_id", escrow->escrow_id},
                   {"provider_refund_id", response.provider_refund_id}});
  return {jobs::handler_status_t::succeeded, {}};
}

}  // namespace disburse::ledger
