#pragma once

#include <disburse/ledger/escrow_ledger.hpp>
#include <disburse/ports/access_policy.hpp>
#include <disburse/ports/event_publisher_port.hpp>
#include <disburse/ports/job_queue_port.hpp>
#include <disburse/ports/notification_port.hpp>
#include <disburse/ports/time_source.hpp>
#include <disburse/schema/escrow.hpp>
#include <disburse/schema/milestone.hpp>
#include <disburse/schema/operation_result.hpp>
#include <disburse/schema/payment_transaction.hpp>
#include <disburse/schema/project.hpp>
#include <disburse/storage/state_store.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace disburse::milestone {

inline constexpr auto kCodespace = std::string_view{"disburse.milestone"};
inline constexpr auto kRefundJobType = std::string_view{"escrow.refund"};

/// Milestone and escrow state after a successful transition.
struct transition final {
  schema::milestone_t milestone;
  std::optional<schema::escrow_t> escrow;
};

using transition_t = transition;

/// Legal milestone transitions, each applied as one conditional write of the
/// milestone together with its escrow.
///
///   pending --fund--> funded --complete--> completed --approve--> approved
///   pending|funded|completed --dispute--> disputed
///   disputed --approve--> approved, --reject--> rejected,
///   disputed --resolve--> funded (or pending without escrow)
///
/// A write that loses a race is re-evaluated against the fresh state, so a
/// failed call never leaves either aggregate partially updated.
class state_machine final {
 public:
  state_machine(storage::state_store& store,
                const ledger::escrow_ledger& ledger,
                const ports::access_policy& access,
                ports::job_queue_port& jobs,
                ports::notification_port& notifications,
                ports::event_publisher_port& events,
                ports::time_source_t clock);

  /// Lock the funds of a succeeded payment against a pending milestone.
  ///
  /// Fails `escrow_already_active` when the milestone already has a locked
  /// or held escrow, `invalid_transition` when it is no longer pending.
  schema::operation_result<transition_t> fund(
      std::string_view milestone_id,
      const schema::payment_transaction_t& transaction);

  /// Member marks the work delivered. Fails `already_processed` when the
  /// milestone is already completed or approved.
  schema::operation_result<transition_t> complete(std::string_view milestone_id,
                                                  std::string_view actor_id);

  /// Owner accepts the work and releases the escrow. Fails
  /// `milestone_not_completed` before completion and `not_funded` without an
  /// active escrow.
  schema::operation_result<transition_t> approve(std::string_view milestone_id,
                                                 std::string_view actor_id);

  /// Member contests the milestone; an active escrow is frozen (held).
  schema::operation_result<transition_t> dispute(std::string_view milestone_id,
                                                 std::string_view actor_id,
                                                 std::string_view reason);

  /// Owner settles a dispute against release: the escrow is refunded and an
  /// `escrow.refund` job returns the money to the payer. Fails
  /// `job_not_enqueued` when the rejection is stored but the job is not; the
  /// owner then calls requeue_refund.
  schema::operation_result<transition_t> reject(std::string_view milestone_id,
                                                std::string_view actor_id,
                                                std::string_view reason);

  /// Enqueue the `escrow.refund` job of a rejected milestone again. Safe to
  /// repeat: the refund goes to the provider under the escrow's key.
  schema::operation_result<schema::job_t> requeue_refund(
      std::string_view milestone_id,
      std::string_view actor_id);

  /// Owner withdraws a dispute without releasing; held funds are locked
  /// again.
  schema::operation_result<transition_t> resolve(std::string_view milestone_id,
                                                 std::string_view actor_id);

 private:
  struct rejection final {
    schema::error_code code{};
    std::string info;
  };

  using step_t = std::function<std::optional<rejection>(
      const schema::milestone_t& current,
      const schema::project_t& project,
      storage::change_set& changes)>;

  /// Load, evaluate `step`, apply; retried on revision conflicts.
  schema::operation_result<transition_t> run(std::string_view milestone_id,
                                             std::string_view action,
                                             const step_t& step);

  void announce(std::string_view action, const transition_t& result);
  schema::operation_result<schema::job_t> enqueue_refund(
      const std::string& escrow_id,
      std::string_view reason);

  storage::state_store& store_;
  const ledger::escrow_ledger& ledger_;
  const ports::access_policy& access_;
  ports::job_queue_port& jobs_;
  ports::notification_port& notifications_;
  ports::event_publisher_port& events_;
  ports::time_source_t clock_;
};

}  // namespace disburse::milestone
