#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <disburse/payment/intent_service.hpp>
#include <exception>

using namespace disburse::schema;

namespace disburse::payment {

intent_service::intent_service(storage::state_store& store,
                               ports::psp_gateway& gateway,
                               ports::event_publisher_port& events,
                               ports::id_generator_t ids,
                               ports::time_source_t clock)
    : store_{store},
      gateway_{gateway},
      events_{events},
      ids_{std::move(ids)},
      clock_{std::move(clock)} {}

operation_result<intent_t> intent_service::create(
    std::string_view project_id,
    std::string_view milestone_id,
    std::string_view payer_id,
    std::string_view provider) {
  if (!provider.empty() && provider != gateway_.provider()) {
    return make_failure<intent_t>(
        error_code::invalid_argument, kCodespace,
        fmt::format("provider {} is not configured", provider));
  }
  auto milestone = store_.find_milestone(milestone_id);
  if (!milestone) {
    return make_failure<intent_t>(
        error_code::milestone_not_found, kCodespace,
        fmt::format("milestone {} does not exist", milestone_id));
  }
  if (milestone->project_id != project_id) {
    return make_failure<intent_t>(
        error_code::invalid_argument, kCodespace,
        fmt::format("milestone {} belongs to project {}", milestone_id,
                    milestone->project_id));
  }
  if (milestone->status != milestone_status_t::pending) {
    return make_failure<intent_t>(
        error_code::invalid_transition, kCodespace,
        fmt::format("milestone {} is {}, only pending milestones take "
                    "payments",
                    milestone_id, to_string(milestone->status)));
  }

  auto transaction = payment_transaction_t{};
  transaction.transaction_id = ids_("pay");
  transaction.project_id = milestone->project_id;
  transaction.milestone_id = milestone->milestone_id;
  transaction.payer_id = std::string{payer_id};
  transaction.provider = std::string{gateway_.provider()};
  transaction.amount = milestone->amount;
  transaction.currency = milestone->currency;
  transaction.status = transaction_status_t::created;

  auto request = ports::intent_request{};
  request.amount = milestone->amount;
  request.currency = milestone->currency;
  request.internal_intent_id = transaction.transaction_id;
  request.description = fmt::format("Escrow for project {} milestone {}",
                                    milestone->project_id,
                                    milestone->milestone_id);

  auto response = ports::intent_response{};
  try {
    response = gateway_.create_intent(request);
  } catch (const std::exception& ex) {
    spdlog::error("{} create_intent failed for milestone {}: {}",
                  transaction.provider, milestone_id, ex.what());
    return make_failure<intent_t>(error_code::gateway_request_failed,
                                  kCodespace, ex.what());
  }
  transaction.provider_intent_id = response.provider_intent_id;
  transaction.created_at = clock_();
  transaction.updated_at = transaction.created_at;

  auto status =
      storage::write_one(store_, storage::write_mode_t::insert, transaction);
  if (status != storage::write_status_t::ok) {
    spdlog::error("Failed to persist transaction {}: {}",
                  transaction.transaction_id, storage::to_string(status));
    return make_failure<intent_t>(error_code::version_conflict, kCodespace,
                                  std::string{storage::to_string(status)});
  }

  spdlog::info("Payment intent {} ({} {}) for milestone {} via {}",
               transaction.transaction_id, format_amount(transaction.amount),
               transaction.currency, milestone_id, transaction.provider);
  events_.publish("payment.intent.created",
                  {{"transaction_id", transaction.transaction_id},
                   {"provider", transaction.provider},
                   {"provider_intent_id", transaction.provider_intent_id}});

  auto out = intent_t{};
  out.transaction = std::move(transaction);
  out.client_secret = std::move(response.client_secret);
  out.checkout_url = std::move(response.checkout_url);
  return make_success(std::move(out), kCodespace);
}

}  // namespace disburse::payment
