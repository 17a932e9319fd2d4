#pragma once

#include <disburse/milestone/state_machine.hpp>
#include <disburse/payout/scheduler.hpp>
#include <disburse/ports/event_publisher_port.hpp>
#include <disburse/ports/notification_port.hpp>
#include <disburse/ports/time_source.hpp>
#include <disburse/schema/operation_result.hpp>
#include <disburse/schema/webhook_outcome.hpp>
#include <disburse/storage/state_store.hpp>
#include <disburse/webhook/event.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace disburse::webhook {

/// Decides whether a raw webhook body really came from `provider`.
using verifier_t = std::function<bool(std::string_view provider,
                                      std::string_view raw_body,
                                      std::string_view signature)>;

/// Verifier that trusts every delivery.
verifier_t accept_all_verifier();

struct reconciliation final {
  schema::webhook_outcome_t outcome{schema::webhook_outcome_t::ignored};
  std::string event_type;
  std::optional<schema::entity_id_t> transaction_id;
  std::optional<schema::entity_id_t> escrow_id;
  std::optional<schema::entity_id_t> batch_id;
  std::string detail;
};

using reconciliation_t = reconciliation;

/// Applies provider events to transactions, escrows and payout items.
///
/// Deliveries may repeat and arrive in any order. A payment event is keyed by
/// its correlation id: once the transaction is terminal every later delivery
/// is a `duplicate` with no side effects. Transfer events are keyed by the
/// provider transfer id stored on the payout item; a failed transfer is
/// handed back to the payout scheduler so a job retries the item.
class reconciler final {
 public:
  reconciler(storage::state_store& store,
             milestone::state_machine& milestones,
             payout::scheduler& payouts,
             ports::notification_port& notifications,
             ports::event_publisher_port& events,
             ports::time_source_t clock,
             verifier_t verifier);

  /// Verify, decode and reconcile one delivery. Fails
  /// `invalid_webhook_signature` or `malformed_webhook` before anything is
  /// read from the store.
  schema::operation_result<reconciliation_t> receive(
      std::string_view provider,
      std::string_view raw_body,
      std::string_view signature);

  /// Fails `correlation_missing` for a payment event without a correlation
  /// id, `transaction_not_found` when it names no known transaction (or the
  /// provider object id disagrees with it), and `batch_not_found` for a
  /// transfer event no payout item recognises.
  schema::operation_result<reconciliation_t> reconcile(const event_t& event);

 private:
  schema::operation_result<reconciliation_t> reconcile_payment(
      const event_t& event);
  schema::operation_result<reconciliation_t> reconcile_transfer(
      const event_t& event);

  storage::state_store& store_;
  milestone::state_machine& milestones_;
  payout::scheduler& payouts_;
  ports::notification_port& notifications_;
  ports::event_publisher_port& events_;
  ports::time_source_t clock_;
  verifier_t verifier_;
};

}  // namespace disburse::webhook
