#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <disburse/ports/sandbox_psp_gateway.hpp>

namespace disburse::ports {

std::string_view sandbox_psp_gateway::provider() const {
  return "sandbox";
}

intent_response sandbox_psp_gateway::create_intent(
    const intent_request& request) {
  auto id = ++sequence_;
  auto response = intent_response{};
  response.provider_intent_id = fmt::format("pi_sandbox_{:08}", id);
  response.client_secret =
      fmt::format("{}_secret_{}", response.provider_intent_id,
                  request.internal_intent_id);
  spdlog::debug("sandbox intent {} for {} {}", response.provider_intent_id,
                request.amount, request.currency);
  return response;
}

transfer_response sandbox_psp_gateway::capture_and_transfer(
    const transfer_request& request) {
  auto lock = std::scoped_lock{mutex_};
  auto found = transfers_.find(request.idempotency_key);
  if (found != std::end(transfers_)) {
    return found->second;
  }
  auto response = transfer_response{};
  response.provider_transfer_id = fmt::format("tr_sandbox_{:08}", ++sequence_);
  response.status = psp_status_t::succeeded;
  transfers_.emplace(request.idempotency_key, response);
  spdlog::debug("sandbox transfer {} of {} {} to {}",
                response.provider_transfer_id, request.amount,
                request.currency, request.recipient_id);
  return response;
}

refund_response sandbox_psp_gateway::refund(const refund_request& request) {
  auto response = refund_response{};
  response.provider_refund_id = fmt::format("re_sandbox_{:08}", ++sequence_);
  response.status = psp_status_t::succeeded;
  spdlog::debug("sandbox refund {} of {} against {}",
                response.provider_refund_id, request.amount,
                request.provider_payment_id);
  return response;
}

uint64_t sandbox_psp_gateway::transfer_count() const {
  auto lock = std::scoped_lock{mutex_};
  return transfers_.size();
}

}  // namespace disburse::ports
