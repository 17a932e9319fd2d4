#pragma once

#include <disburse/config/engine_config.hpp>
#include <disburse/jobs/queue.hpp>
#include <disburse/jobs/registry.hpp>
#include <disburse/jobs/runner.hpp>
#include <disburse/ledger/escrow_ledger.hpp>
#include <disburse/ledger/refund_executor.hpp>
#include <disburse/milestone/state_machine.hpp>
#include <disburse/payment/intent_service.hpp>
#include <disburse/payout/executor.hpp>
#include <disburse/payout/scheduler.hpp>
#include <disburse/ports/access_policy.hpp>
#include <disburse/ports/event_publisher_port.hpp>
#include <disburse/ports/id_generator.hpp>
#include <disburse/ports/notification_port.hpp>
#include <disburse/ports/psp_gateway.hpp>
#include <disburse/ports/time_source.hpp>
#include <disburse/schema/job.hpp>
#include <disburse/schema/job_status.hpp>
#include <disburse/schema/milestone.hpp>
#include <disburse/schema/operation_result.hpp>
#include <disburse/schema/project.hpp>
#include <disburse/schema/revenue_split.hpp>
#include <disburse/schema/split_breakdown.hpp>
#include <disburse/split/calculator.hpp>
#include <disburse/storage/state_store.hpp>
#include <disburse/webhook/reconciler.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace disburse::execution {

inline constexpr auto kCodespace = std::string_view{"disburse.project"};

/// Collaborators the engine does not own. References must outlive the
/// engine.
struct engine_ports final {
  storage::state_store& store;
  ports::psp_gateway& gateway;
  ports::notification_port& notifications;
  ports::event_publisher_port& events;
  const ports::access_policy& access;
  ports::time_source_t clock;
  ports::id_generator_t ids;
  jobs::random_source_t random;
  webhook::verifier_t verifier;
};

/// Settlement engine: the entry point the API layer calls.
///
/// Wires the split calculator, milestone/escrow state machine, payout
/// scheduler, job queue and runner, webhook reconciler and payment intents
/// over one state store. All operations are safe to call from multiple
/// threads.
class engine final {
 public:
  engine(config::engine_config config, engine_ports ports);
  ~engine();

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  /// Create a project owned by `owner_id`. The split set is validated with
  /// the calculator's rules before anything is stored.
  schema::operation_result<schema::project_t> create_project(
      std::string_view owner_id,
      std::vector<schema::entity_id_t> member_ids,
      std::vector<schema::revenue_split_t> splits);

  /// Swap the active split set. `expected_revision` is the project revision
  /// the caller last read; a stale value fails `version_conflict`.
  schema::operation_result<schema::project_t> replace_splits(
      std::string_view project_id,
      std::string_view actor_id,
      uint64_t expected_revision,
      std::vector<schema::revenue_split_t> splits);

  schema::operation_result<schema::milestone_t> create_milestone(
      std::string_view project_id,
      std::string_view actor_id,
      std::string title,
      schema::amount_t amount,
      std::string_view currency);

  schema::operation_result<schema::split_breakdown_t> calculate_split(
      schema::amount_t amount,
      std::string_view currency,
      const std::vector<schema::revenue_split_t>& splits) const;

  schema::operation_result<schema::payout_batch_t> schedule_payouts(
      const payout::schedule_request& request);

  schema::operation_result<milestone::transition_t> complete_milestone(
      std::string_view milestone_id,
      std::string_view actor_id);

  /// Approve and release; on success the payout batch is scheduled right
  /// away. A scheduling failure does not undo the release and is reported
  /// in the result's `info`.
  schema::operation_result<milestone::transition_t> approve_milestone(
      std::string_view milestone_id,
      std::string_view actor_id);

  schema::operation_result<milestone::transition_t> dispute_milestone(
      std::string_view milestone_id,
      std::string_view actor_id,
      std::string_view reason);
  schema::operation_result<milestone::transition_t> reject_milestone(
      std::string_view milestone_id,
      std::string_view actor_id,
      std::string_view reason);
  schema::operation_result<milestone::transition_t> resolve_dispute(
      std::string_view milestone_id,
      std::string_view actor_id);
  schema::operation_result<schema::job_t> requeue_refund(
      std::string_view milestone_id,
      std::string_view actor_id);

  schema::operation_result<payment::intent_t> create_payment_intent(
      std::string_view project_id,
      std::string_view milestone_id,
      std::string_view payer_id,
      std::string_view provider = {});

  schema::operation_result<webhook::reconciliation_t> receive_webhook(
      std::string_view provider,
      std::string_view raw_body,
      std::string_view signature);

  /// Execute runnable jobs on the calling thread; returns how many ran.
  std::size_t run_pending_jobs();
  void start_workers();
  void stop_workers();

  schema::operation_result<schema::job_t> requeue_dead_letter(
      std::string_view job_id);
  std::vector<schema::job_t> list_jobs(
      std::optional<schema::job_status_t> status = std::nullopt) const;

  const storage::state_store& store() const;
  const config::engine_config& configuration() const;

 private:
  config::engine_config config_;
  storage::state_store& store_;
  ports::notification_port& notifications_;
  const ports::access_policy& access_;
  ports::time_source_t clock_;
  ports::id_generator_t ids_;

  split::calculator calculator_;
  jobs::registry registry_;
  jobs::queue queue_;
  ledger::escrow_ledger ledger_;
  milestone::state_machine milestones_;
  payout::scheduler scheduler_;
  webhook::reconciler reconciler_;
  payment::intent_service intents_;
  payout::executor payouts_;
  ledger::refund_executor refunds_;
  jobs::runner runner_;
};

}  // namespace disburse::execution
