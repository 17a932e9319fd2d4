#pragma once

#include <disburse/ports/event_publisher_port.hpp>
#include <disburse/ports/id_generator.hpp>
#include <disburse/ports/job_queue_port.hpp>
#include <disburse/ports/notification_port.hpp>
#include <disburse/ports/time_source.hpp>
#include <disburse/schema/operation_result.hpp>
#include <disburse/schema/payout_batch.hpp>
#include <disburse/schema/placeholder_policy.hpp>
#include <disburse/split/calculator.hpp>
#include <disburse/storage/state_store.hpp>

#include <optional>
#include <string_view>

namespace disburse::payout {

inline constexpr auto kCodespace = std::string_view{"disburse.payout"};
inline constexpr auto kExecuteJobType = std::string_view{"payout.execute"};

struct schedule_request final {
  schema::entity_id_t escrow_id;
  schema::entity_id_t project_id;
  std::optional<schema::entity_id_t> milestone_id;
  schema::amount_t amount{};
  schema::currency_t currency;
};

/// Turns a released escrow into exactly one payout batch and its
/// `payout.execute` job.
class scheduler final {
 public:
  scheduler(storage::state_store& store,
            const split::calculator& calculator,
            ports::job_queue_port& jobs,
            ports::notification_port& notifications,
            ports::event_publisher_port& events,
            ports::id_generator_t ids,
            ports::time_source_t clock,
            schema::placeholder_policy_t policy);

  /// Create the batch for `request.escrow_id`.
  ///
  /// The escrow id is the idempotency key: creation is a conditional insert,
  /// so of any number of concurrent calls exactly one succeeds and the rest
  /// fail `already_scheduled`. Also fails `escrow_not_found`,
  /// `invalid_transition` (escrow not released), `invalid_amount` and
  /// `invalid_currency` (request disagrees with the escrow),
  /// `project_not_found`, `no_recipients` and any split validation error.
  ///
  /// When the job cannot be enqueued the batch is marked failed and the call
  /// fails `job_not_enqueued`; a later call for the same escrow picks that
  /// batch up again instead of failing `already_scheduled`.
  schema::operation_result<schema::payout_batch_t> schedule(
      const schedule_request& request);

  /// Enqueue a retry `payout.execute` job for a batch that still has
  /// scheduled or failed items and no queued job. Paid and failed batches
  /// are returned unchanged.
  schema::operation_result<schema::payout_batch_t> resume(
      std::string_view batch_id);

  schema::placeholder_policy_t policy() const;

 private:
  /// Failed before any job was linked.
  static bool is_orphaned(const schema::payout_batch_t& batch);
  schema::operation_result<schema::payout_batch_t> recover(
      const schema::payout_batch_t& orphan);
  schema::operation_result<schema::payout_batch_t> launch(
      schema::payout_batch_t batch,
      bool is_retry);
  void abandon(const schema::payout_batch_t& batch);
  void announce_scheduled(const schema::payout_batch_t& batch);

  storage::state_store& store_;
  const split::calculator& calculator_;
  ports::job_queue_port& jobs_;
  ports::notification_port& notifications_;
  ports::event_publisher_port& events_;
  ports::id_generator_t ids_;
  ports::time_source_t clock_;
  schema::placeholder_policy_t policy_;
};

}  // namespace disburse::payout
