#pragma once

#include <disburse/jobs/runner.hpp>
#include <disburse/ports/event_publisher_port.hpp>
#include <disburse/ports/notification_port.hpp>
#include <disburse/ports/psp_gateway.hpp>
#include <disburse/ports/time_source.hpp>
#include <disburse/schema/job.hpp>
#include <disburse/schema/payout_batch.hpp>
#include <disburse/storage/state_store.hpp>

#include <cstddef>
#include <stop_token>
#include <string>

namespace disburse::payout {

/// Handler for `payout.execute` jobs.
///
/// Moves each unpaid item of a batch through the PSP gateway. Item status
/// and attempt counters are kept on the batch, so a job retry only touches
/// items that are not yet paid or awaiting confirmation. Before any money
/// moves the escrow is re-read; a batch whose escrow is no longer released
/// is failed without calling the gateway.
class executor final {
 public:
  executor(storage::state_store& store,
           ports::psp_gateway& gateway,
           ports::notification_port& notifications,
           ports::event_publisher_port& events,
           ports::time_source_t clock);

  jobs::handler_result operator()(const schema::job_t& job,
                                  std::stop_token stop);

  /// Dead-letter hook: fail the job's batch unless it is already paid or
  /// failed, however the job ran out of attempts.
  void give_up(const schema::job_t& job);

  /// Idempotency key the gateway sees for one item: `<batch>:<index>`,
  /// suffixed with `:<round>` once the provider has failed the item.
  static std::string transfer_key(const schema::payout_batch_t& batch,
                                  std::size_t index);

 private:
  void fail_batch(const std::string& batch_id, const std::string& reason);
  jobs::handler_result abort_batch(const schema::payout_batch_t& batch,
                                   const std::string& reason);
  void transfer_item(const schema::payout_batch_t& batch,
                     const std::string& provider_payment_id,
                     std::size_t index);
  void announce_paid(const schema::payout_batch_t& batch);

  storage::state_store& store_;
  ports::psp_gateway& gateway_;
  ports::notification_port& notifications_;
  ports::event_publisher_port& events_;
  ports::time_source_t clock_;
};

}  // namespace disburse::payout
