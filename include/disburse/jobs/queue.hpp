#pragma once

#include <disburse/jobs/backoff.hpp>
#include <disburse/jobs/registry.hpp>
#include <disburse/ports/id_generator.hpp>
#include <disburse/ports/job_queue_port.hpp>
#include <disburse/ports/time_source.hpp>
#include <disburse/schema/job.hpp>
#include <disburse/schema/operation_result.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace disburse::jobs {

/// Called once for every job that reaches `dlq`, outside the queue lock.
using dead_letter_hook_t = std::function<void(const schema::job_t& job)>;

/// In-memory job store with exclusive, expiring leases.
///
/// Every method takes the queue mutex, so lease selection and the
/// status checks of report_success/report_failure are atomic.
class queue final : public ports::job_queue_port {
 public:
  queue(const registry& types,
        ports::time_source_t clock,
        ports::id_generator_t ids,
        random_source_t random,
        backoff_policy backoff = {},
        schema::duration_milliseconds_t lease_grace = 5'000,
        int32_t default_priority = schema::kDefaultJobPriority);

  schema::operation_result<schema::job_t> enqueue(
      std::string_view type,
      schema::job_payload_t payload,
      std::optional<int32_t> priority = std::nullopt) override;

  /// Lease the most urgent runnable job: highest priority, then earliest
  /// next_run_at, then oldest. Jobs whose type is at its concurrency limit
  /// are skipped. Expired leases are reclaimed first and count as a failed
  /// attempt.
  std::optional<schema::job_t> lease(std::string_view worker_id);

  /// Push the lease expiry of a job still held by `worker_id` one full
  /// timeout into the future. Fails `job_not_leased` otherwise.
  schema::operation_result<schema::job_t> extend_lease(
      std::string_view job_id,
      std::string_view worker_id);

  /// Mark a job leased by `worker_id` as succeeded.
  schema::operation_result<schema::job_t> report_success(
      std::string_view job_id,
      std::string_view worker_id);

  /// Record a failed attempt. The job returns to `queued` with a backoff
  /// delay, or moves to `dlq` once attempts are exhausted or `permanent`.
  schema::operation_result<schema::job_t> report_failure(
      std::string_view job_id,
      std::string_view worker_id,
      std::string_view error,
      bool permanent = false);

  /// Operator action: give a dead-lettered job a fresh set of attempts.
  schema::operation_result<schema::job_t> requeue_dead_letter(
      std::string_view job_id);

  /// Run `hook` whenever a job of `type` is dead-lettered, whether by a
  /// reported failure or a reclaimed lease.
  void on_dead_letter(std::string type, dead_letter_hook_t hook);

  std::optional<schema::job_t> find(std::string_view job_id) const override;
  std::vector<schema::job_t> list(
      std::optional<schema::job_status_t> status = std::nullopt) const;

  /// Earliest next_run_at among queued jobs, for idle workers.
  std::optional<schema::timestamp_milliseconds_t> next_due() const;

  const registry& types() const;

 private:
  /// Returns true when the job moved to `dlq`.
  bool fail_locked(schema::job_t& job,
                   std::string_view error,
                   bool permanent,
                   schema::timestamp_milliseconds_t now);
  void reclaim_expired_locked(schema::timestamp_milliseconds_t now,
                              std::vector<schema::job_t>& dead);
  schema::duration_milliseconds_t lease_duration(std::string_view type) const;
  void announce_dead_letters(const std::vector<schema::job_t>& dead) const;
  schema::operation_result<schema::job_t*> leased_by_locked(
      std::string_view job_id,
      std::string_view worker_id);

  const registry& types_;
  ports::time_source_t clock_;
  ports::id_generator_t ids_;
  random_source_t random_;
  backoff_policy backoff_;
  schema::duration_milliseconds_t lease_grace_;
  int32_t default_priority_;

  mutable std::mutex mutex_;
  std::map<std::string, schema::job_t, std::less<>> jobs_;
  std::map<std::string, dead_letter_hook_t, std::less<>> dead_letter_hooks_;
  uint64_t sequence_{};
};

}  // namespace disburse::jobs
