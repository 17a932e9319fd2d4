#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <disburse/jobs/runner.hpp>
#include <algorithm>
#include <exception>
#include <future>

using namespace disburse::schema;

namespace disburse::jobs {

runner::runner(queue& jobs,
               const uint32_t worker_count,
               const std::chrono::milliseconds poll_interval)
    : jobs_{jobs},
      worker_count_{worker_count == 0 ? 1 : worker_count},
      poll_interval_{poll_interval} {}

runner::~runner() {
  stop();
}

void runner::register_handler(std::string type, handler_t handler) {
  auto lock = std::scoped_lock{mutex_};
  handlers_.insert_or_assign(std::move(type), std::move(handler));
}

void runner::start() {
  if (running_.exchange(true)) {
    return;
  }
  spdlog::info("Starting {} job worker(s)", worker_count_);
  for (uint32_t i = 0; i < worker_count_; ++i) {
    workers_.emplace_back(&runner::run, this, fmt::format("worker-{}", i));
  }
}

void runner::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  wake_.notify_all();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
  spdlog::info("Job workers stopped");
}

bool runner::running() const {
  return running_;
}

void runner::notify() {
  wake_.notify_all();
}

void runner::run(std::string worker_id) {
  while (running_) {
    if (run_once(worker_id)) {
      continue;
    }
    auto lock = std::unique_lock{mutex_};
    wake_.wait_for(lock, poll_interval_, [this] { return !running_; });
  }
}

std::size_t runner::drain(const std::string& worker_id) {
  auto executed = std::size_t{};
  while (run_once(worker_id)) {
    ++executed;
  }
  return executed;
}

bool runner::run_once(const std::string& worker_id) {
  auto job = jobs_.lease(worker_id);
  if (!job) {
    return false;
  }

  auto handler = handler_t{};
  {
    auto lock = std::scoped_lock{mutex_};
    auto found = handlers_.find(job->type);
    if (found != std::end(handlers_)) {
      handler = found->second;
    }
  }

  auto result = handler_result{};
  if (!handler) {
    result = handler_result{handler_status_t::permanent_failure,
                            fmt::format("no handler for '{}'", job->type)};
  } else {
    result = execute(*job, handler, worker_id);
  }

  auto reported = result.status == handler_status_t::succeeded
                      ? jobs_.report_success(job->job_id, worker_id)
                      : jobs_.report_failure(
                            job->job_id, worker_id, result.message,
                            result.status ==
                                handler_status_t::permanent_failure);
  if (!reported.ok()) {
    spdlog::warn("Worker {} lost job {} before reporting: {}", worker_id,
                 job->job_id, reported.info);
  }
  return true;
}

handler_result runner::execute(const job_t& job,
                               const handler_t& handler,
                               const std::string& worker_id) {
  const auto* definition = jobs_.types().find(job.type);
  auto timeout = std::chrono::seconds{
      definition ? definition->policy.timeout_seconds : 60};
  auto heartbeat = std::min<std::chrono::milliseconds>(poll_interval_, timeout);

  auto stop = std::stop_source{};
  auto task = std::packaged_task<handler_result()>{
      [&handler, &job, token = stop.get_token()] {
        return handler(job, token);
      }};
  auto future = task.get_future();
  auto thread = std::thread{std::move(task)};

  // The job stays leased to this worker until the handler thread has
  // returned, however long that takes after the stop request.
  auto deadline = std::chrono::steady_clock::now() + timeout;
  auto timed_out = false;
  while (future.wait_for(heartbeat) == std::future_status::timeout) {
    auto extended = jobs_.extend_lease(job.job_id, worker_id);
    if (!extended.ok()) {
      spdlog::warn("Worker {} could not extend lease on job {}: {}",
                   worker_id, job.job_id, extended.info);
    }
    if (!timed_out && std::chrono::steady_clock::now() >= deadline) {
      timed_out = true;
      stop.request_stop();
      spdlog::error("Job {} ({}) exceeded its {} s timeout", job.job_id,
                    job.type, timeout.count());
    }
  }
  thread.join();

  if (timed_out) {
    return handler_result{
        handler_status_t::retry,
        fmt::format("timed out after {} s", timeout.count())};
  }
  try {
    return future.get();
  } catch (const std::exception& ex) {
    spdlog::warn("Job {} ({}) handler threw: {}", job.job_id, job.type,
                 ex.what());
    return handler_result{handler_status_t::retry, ex.what()};
  }
}

}  // namespace disburse::jobs
