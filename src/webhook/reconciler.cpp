#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <disburse/webhook/reconciler.hpp>
#include <algorithm>

using namespace disburse::schema;

namespace disburse::webhook {

namespace {

operation_result<reconciliation_t> duplicate(reconciliation_t result,
                                             std::string detail) {
  spdlog::info("Duplicate webhook {}: {}", result.event_type, detail);
  result.outcome = webhook_outcome_t::duplicate;
  result.detail = std::move(detail);
  return make_success(std::move(result), kCodespace);
}

}  // namespace

verifier_t accept_all_verifier() {
  return [](std::string_view, std::string_view, std::string_view) {
    return true;
  };
}

reconciler::reconciler(storage::state_store& store,
                       milestone::state_machine& milestones,
                       payout::scheduler& payouts,
                       ports::notification_port& notifications,
                       ports::event_publisher_port& events,
                       ports::time_source_t clock,
                       verifier_t verifier)
    : store_{store},
      milestones_{milestones},
      payouts_{payouts},
      notifications_{notifications},
      events_{events},
      clock_{std::move(clock)},
      verifier_{verifier ? std::move(verifier) : accept_all_verifier()} {}

operation_result<reconciliation_t> reconciler::receive(
    std::string_view provider,
    std::string_view raw_body,
    std::string_view signature) {
  if (!verifier_(provider, raw_body, signature)) {
    spdlog::warn("Rejected {} webhook: signature mismatch", provider);
    return make_failure<reconciliation_t>(
        error_code::invalid_webhook_signature, kCodespace,
        fmt::format("signature rejected for provider {}", provider));
  }
  auto decoded = decode(raw_body);
  if (!decoded.ok()) {
    return forward_failure<reconciliation_t>(decoded);
  }
  spdlog::debug("Webhook from {}: {} ({})", provider, decoded.value->type,
                to_string(decoded.value->kind));
  return reconcile(*decoded.value);
}

operation_result<reconciliation_t> reconciler::reconcile(const event_t& event) {
  switch (event.kind) {
    case event_kind_t::payment_succeeded:
    case event_kind_t::payment_failed:
      return reconcile_payment(event);
    case event_kind_t::transfer_paid:
    case event_kind_t::transfer_failed:
      return reconcile_transfer(event);
    case event_kind_t::unrecognized:
      break;
  }
  spdlog::info("Ignoring webhook event {}", event.type);
  auto result = reconciliation_t{};
  result.outcome = webhook_outcome_t::ignored;
  result.event_type = event.type;
  return make_success(std::move(result), kCodespace);
}

operation_result<reconciliation_t> reconciler::reconcile_payment(
    const event_t& event) {
  if (!event.correlation_id) {
    spdlog::warn("Webhook {} carries no correlation id", event.type);
    return make_failure<reconciliation_t>(
        error_code::correlation_missing, kCodespace,
        "data.object.metadata.internal_intent_id is required");
  }
  const auto& transaction_id = *event.correlation_id;
  auto transaction = store_.find_transaction(transaction_id);
  if (!transaction) {
    return make_failure<reconciliation_t>(
        error_code::transaction_not_found, kCodespace,
        fmt::format("no transaction {}", transaction_id));
  }
  if (!event.provider_object_id.empty() &&
      !transaction->provider_intent_id.empty() &&
      event.provider_object_id != transaction->provider_intent_id) {
    spdlog::warn("Webhook for {} names provider object {}, expected {}",
                 transaction_id, event.provider_object_id,
                 transaction->provider_intent_id);
    return make_failure<reconciliation_t>(
        error_code::transaction_not_found, kCodespace,
        fmt::format("provider object {} does not belong to transaction {}",
                    event.provider_object_id, transaction_id));
  }

  auto result = reconciliation_t{};
  result.event_type = event.type;
  result.transaction_id = transaction_id;

  const auto succeeded = event.kind == event_kind_t::payment_succeeded;
  auto already_final = std::optional<transaction_status_t>{};
  auto updated = storage::modify<payment_transaction_t>(
      store_, [&] { return store_.find_transaction(transaction_id); },
      [&](payment_transaction_t& tx) {
        if (is_terminal(tx.status)) {
          already_final = tx.status;
          return false;
        }
        already_final.reset();
        tx.status = succeeded ? transaction_status_t::succeeded
                              : transaction_status_t::failed;
        if (succeeded && !event.provider_object_id.empty()) {
          tx.provider_payment_id = event.provider_object_id;
        }
        if (!succeeded) {
          tx.failure_reason = event.failure_reason;
        }
        tx.updated_at = clock_();
        return true;
      });
  if (!updated) {
    if (already_final) {
      return duplicate(std::move(result),
                       fmt::format("transaction {} already {}",
                                   transaction_id, to_string(*already_final)));
    }
    spdlog::error("Could not update transaction {} for webhook {}",
                  transaction_id, event.type);
    return make_failure<reconciliation_t>(
        error_code::version_conflict, kCodespace,
        fmt::format("transaction {} kept changing", transaction_id));
  }
  spdlog::info("Transaction {} -> {}", transaction_id,
               to_string(updated->status));
  result.outcome = webhook_outcome_t::applied;

  if (succeeded) {
    auto funded = milestones_.fund(updated->milestone_id, *updated);
    if (funded.ok()) {
      result.escrow_id = funded.value->escrow->escrow_id;
    } else {
      // The payment stays succeeded; the lock failure is surfaced in detail.
      spdlog::warn("Payment {} succeeded but escrow lock failed: {} {}",
                   transaction_id, funded.log, funded.info);
      result.detail = fmt::format("escrow not locked: {}", funded.info);
    }
  }

  auto attributes = ports::event_attributes_t{
      {"transaction_id", transaction_id},
      {"status", std::string{to_string(updated->status)}},
      {"provider_object_id", event.provider_object_id}};
  if (result.escrow_id) {
    attributes.emplace("escrow_id", *result.escrow_id);
  }
  events_.publish("payment.updated", attributes);
  return make_success(std::move(result), kCodespace);
}

operation_result<reconciliation_t> reconciler::reconcile_transfer(
    const event_t& event) {
  auto result = reconciliation_t{};
  result.event_type = event.type;

  if (event.provider_object_id.empty()) {
    return make_failure<reconciliation_t>(
        error_code::malformed_webhook, kCodespace,
        "transfer event has no data.object.id");
  }
  auto batch = store_.find_batch_by_transfer(event.provider_object_id);
  if (!batch) {
    return make_failure<reconciliation_t>(
        error_code::batch_not_found, kCodespace,
        fmt::format("no payout item for transfer {}",
                    event.provider_object_id));
  }
  result.batch_id = batch->batch_id;
  result.escrow_id = batch->escrow_id;

  const auto paid = event.kind == event_kind_t::transfer_paid;
  auto settled_as = std::optional<payout_status_t>{};
  auto updated = storage::modify<payout_batch_t>(
      store_, [&] { return store_.find_batch(batch->batch_id); },
      [&](payout_batch_t& current) {
        auto item = std::ranges::find_if(current.items, [&](const auto& it) {
          return it.provider_transfer_id == event.provider_object_id;
        });
        if (item == std::end(current.items)) {
          return false;
        }
        if (item->status == payout_status_t::paid ||
            (!paid && item->status == payout_status_t::failed)) {
          settled_as = item->status;
          return false;
        }
        settled_as.reset();
        item->status = paid ? payout_status_t::paid : payout_status_t::failed;
        item->failure_reason = paid ? std::string{} : event.failure_reason;
        if (!paid) {
          // The provider answered for this key; the retry needs a new one.
          item->transfer_round += 1;
        }
        auto derived = derive_batch_status(current);
        if (current.status != payout_status_t::failed ||
            derived == payout_status_t::paid) {
          current.status = derived;
        }
        current.updated_at = clock_();
        return true;
      });
  if (!updated) {
    if (settled_as) {
      return duplicate(std::move(result),
                       fmt::format("transfer {} already {}",
                                   event.provider_object_id,
                                   to_string(*settled_as)));
    }
    spdlog::error("Could not record transfer {} on batch {}",
                  event.provider_object_id, batch->batch_id);
    return make_failure<reconciliation_t>(
        error_code::version_conflict, kCodespace,
        fmt::format("batch {} kept changing", batch->batch_id));
  }

  result.outcome = webhook_outcome_t::applied;
  spdlog::info("Transfer {} on batch {} {}; batch now {}",
               event.provider_object_id, updated->batch_id,
               paid ? "paid" : "failed", to_string(updated->status));
  if (updated->status == payout_status_t::paid) {
    for (const auto& item : updated->items) {
      notifications_.notify(
          item.recipient_id, "payout.paid",
          fmt::format("Your payout of {} {} has been sent",
                      format_amount(item.net_amount), updated->currency));
    }
    events_.publish("payout.paid",
                    {{"batch_id", updated->batch_id},
                     {"escrow_id", updated->escrow_id},
                     {"total_net", std::to_string(updated->total_net)}});
  }
  if (!paid) {
    auto resumed = payouts_.resume(updated->batch_id);
    if (!resumed.ok()) {
      spdlog::error("Failed transfer {} on batch {} will not be retried: {} {}",
                    event.provider_object_id, updated->batch_id, resumed.log,
                    resumed.info);
      result.detail = resumed.info;
    }
  }
  return make_success(std::move(result), kCodespace);
}

}  // namespace disburse::webhook
