#pragma once

#include <disburse/jobs/queue.hpp>
#include <disburse/jobs/registry.hpp>
#include <disburse/schema/job.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace disburse::jobs {

enum class handler_status_t : uint8_t {
  succeeded = 0,
  retry = 1,
  permanent_failure = 2
};

struct handler_result final {
  handler_status_t status{handler_status_t::succeeded};
  std::string message;
};

/// Executes one job. The stop token is signalled when the job's timeout
/// elapses; long running handlers should poll it between external calls.
/// The attempt is not reported, and the job not released, until the
/// handler returns. Throwing std::exception counts as a retryable failure.
using handler_t =
    std::function<handler_result(const schema::job_t& job, std::stop_token)>;

/// Pool of worker threads draining a job queue.
class runner final {
 public:
  runner(queue& jobs,
         uint32_t worker_count,
         std::chrono::milliseconds poll_interval);
  ~runner();

  runner(const runner&) = delete;
  runner& operator=(const runner&) = delete;

  void register_handler(std::string type, handler_t handler);

  void start();
  void stop();
  bool running() const;

  /// Lease and execute at most one job as `worker_id`. Returns false when
  /// nothing was runnable.
  bool run_once(const std::string& worker_id);

  /// Run jobs on the calling thread until nothing is runnable; returns the
  /// number executed.
  std::size_t drain(const std::string& worker_id);

  /// Wake idle workers, e.g. after enqueueing.
  void notify();

 private:
  void run(std::string worker_id);
  handler_result execute(const schema::job_t& job,
                         const handler_t& handler,
                         const std::string& worker_id);

  queue& jobs_;
  uint32_t worker_count_;
  std::chrono::milliseconds poll_interval_;

  mutable std::mutex mutex_;
  std::condition_variable wake_;
  std::map<std::string, handler_t, std::less<>> handlers_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace disburse::jobs
