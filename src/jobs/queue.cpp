#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <disburse/jobs/queue.hpp>
#include <algorithm>
#include <tuple>

using namespace disburse::schema;

namespace disburse::jobs {

queue::queue(const registry& types,
             ports::time_source_t clock,
             ports::id_generator_t ids,
             random_source_t random,
             backoff_policy backoff,
             const duration_milliseconds_t lease_grace,
             const int32_t default_priority)
    : types_{types},
      clock_{std::move(clock)},
      ids_{std::move(ids)},
      random_{std::move(random)},
      backoff_{backoff},
      lease_grace_{lease_grace},
      default_priority_{default_priority} {}

const registry& queue::types() const {
  return types_;
}

operation_result<job_t> queue::enqueue(std::string_view type,
                                       job_payload_t payload,
                                       std::optional<int32_t> priority) {
  auto validated = types_.validate(type, payload);
  if (!validated.ok()) {
    spdlog::warn("Rejected {} job: {} {}", type, validated.log,
                 validated.info);
    return forward_failure<job_t>(validated);
  }

  auto lock = std::scoped_lock{mutex_};
  auto now = clock_();
  auto job = job_t{};
  job.job_id = ids_("job");
  job.type = std::string{type};
  job.priority = priority.value_or(default_priority_);
  job.status = job_status_t::queued;
  job.payload = std::move(payload);
  job.max_attempts = validated.value->max_attempts;
  job.next_run_at = now;
  job.sequence = ++sequence_;
  job.created_at = now;
  job.updated_at = now;
  jobs_.emplace(job.job_id, job);
  spdlog::info("Enqueued job {} ({}) priority {}", job.job_id, job.type,
               job.priority);
  return make_success(std::move(job), kCodespace);
}

bool queue::fail_locked(job_t& job,
                        std::string_view error,
                        const bool permanent,
                        const timestamp_milliseconds_t now) {
  job.attempt += 1;
  job.last_error = std::string{error};
  job.worker_id.reset();
  job.lease_expires_at.reset();
  job.updated_at = now;
  if (permanent || job.attempt >= job.max_attempts) {
    job.status = job_status_t::dlq;
    spdlog::error("Job {} ({}) moved to dead letter after {} attempt(s): {}",
                  job.job_id, job.type, job.attempt, error);
    return true;
  }
  auto delay = compute_backoff(backoff_, job.attempt, random_);
  job.status = job_status_t::queued;
  job.next_run_at = now + delay;
  spdlog::warn("Job {} ({}) attempt {}/{} failed, retry in {} ms: {}",
               job.job_id, job.type, job.attempt, job.max_attempts, delay,
               error);
  return false;
}

void queue::reclaim_expired_locked(const timestamp_milliseconds_t now,
                                   std::vector<job_t>& dead) {
  for (auto& [id, job] : jobs_) {
    if (job.status == job_status_t::leased && job.lease_expires_at &&
        *job.lease_expires_at <= now) {
      spdlog::warn("Lease on job {} held by {} expired", id,
                   job.worker_id.value_or("?"));
      if (fail_locked(job, "lease expired", false, now)) {
        dead.push_back(job);
      }
    }
  }
}

duration_milliseconds_t queue::lease_duration(std::string_view type) const {
  const auto* definition = types_.find(type);
  auto timeout_ms = static_cast<duration_milliseconds_t>(
                        definition ? definition->policy.timeout_seconds : 60) *
                    1000;
  return timeout_ms + lease_grace_;
}

void queue::announce_dead_letters(const std::vector<job_t>& dead) const {
  for (const auto& job : dead) {
    auto hook = dead_letter_hook_t{};
    {
      auto lock = std::scoped_lock{mutex_};
      auto found = dead_letter_hooks_.find(job.type);
      if (found != std::end(dead_letter_hooks_)) {
        hook = found->second;
      }
    }
    if (hook) {
      hook(job);
    }
  }
}

void queue::on_dead_letter(std::string type, dead_letter_hook_t hook) {
  auto lock = std::scoped_lock{mutex_};
  dead_letter_hooks_.insert_or_assign(std::move(type), std::move(hook));
}

std::optional<job_t> queue::lease(std::string_view worker_id) {
  auto dead = std::vector<job_t>{};
  auto leased = std::optional<job_t>{};
  {
    auto lock = std::scoped_lock{mutex_};
    auto now = clock_();
    reclaim_expired_locked(now, dead);

    auto active = std::map<std::string, uint32_t, std::less<>>{};
    for (const auto& [id, job] : jobs_) {
      if (job.status == job_status_t::leased) {
        ++active[job.type];
      }
    }

    job_t* best = nullptr;
    for (auto& [id, job] : jobs_) {
      if (job.status != job_status_t::queued || job.next_run_at > now) {
        continue;
      }
      const auto* definition = types_.find(job.type);
      if (definition != nullptr && definition->policy.concurrency_limit &&
          active[job.type] >= *definition->policy.concurrency_limit) {
        continue;
      }
      if (best == nullptr ||
          std::tuple{-job.priority, job.next_run_at, job.sequence} <
              std::tuple{-best->priority, best->next_run_at, best->sequence}) {
        best = &job;
      }
    }
    if (best != nullptr) {
      best->status = job_status_t::leased;
      best->worker_id = std::string{worker_id};
      best->lease_expires_at = now + lease_duration(best->type);
      best->updated_at = now;
      spdlog::debug("Worker {} leased job {} ({}) attempt {}", worker_id,
                    best->job_id, best->type, best->attempt + 1);
      leased = *best;
    }
  }
  announce_dead_letters(dead);
  return leased;
}

operation_result<job_t*> queue::leased_by_locked(std::string_view job_id,
                                                 std::string_view worker_id) {
  auto found = jobs_.find(job_id);
  if (found == std::end(jobs_)) {
    return make_failure<job_t*>(error_code::job_not_found, kCodespace,
                                fmt::format("job {} does not exist", job_id));
  }
  auto& job = found->second;
  if (job.status != job_status_t::leased || job.worker_id != worker_id) {
    return make_failure<job_t*>(
        error_code::job_not_leased, kCodespace,
        fmt::format("job {} is {} and not leased by {}", job_id,
                    to_string(job.status), worker_id));
  }
  return make_success(&job, kCodespace);
}

operation_result<job_t> queue::report_success(std::string_view job_id,
                                              std::string_view worker_id) {
  auto lock = std::scoped_lock{mutex_};
  auto leased = leased_by_locked(job_id, worker_id);
  if (!leased.ok()) {
    spdlog::warn("Ignoring success report: {}", leased.info);
    return forward_failure<job_t>(leased);
  }
  auto& job = **leased.value;
  job.status = job_status_t::succeeded;
  job.worker_id.reset();
  job.lease_expires_at.reset();
  job.updated_at = clock_();
  spdlog::info("Job {} ({}) succeeded", job.job_id, job.type);
  return make_success(job, kCodespace);
}

operation_result<job_t> queue::extend_lease(std::string_view job_id,
                                            std::string_view worker_id) {
  auto lock = std::scoped_lock{mutex_};
  auto leased = leased_by_locked(job_id, worker_id);
  if (!leased.ok()) {
    return forward_failure<job_t>(leased);
  }
  auto& job = **leased.value;
  auto now = clock_();
  job.lease_expires_at = now + lease_duration(job.type);
  job.updated_at = now;
  return make_success(job, kCodespace);
}

operation_result<job_t> queue::report_failure(std::string_view job_id,
                                              std::string_view worker_id,
                                              std::string_view error,
                                              const bool permanent) {
  auto dead = std::vector<job_t>{};
  auto failed = job_t{};
  {
    auto lock = std::scoped_lock{mutex_};
    auto leased = leased_by_locked(job_id, worker_id);
    if (!leased.ok()) {
      spdlog::warn("Ignoring failure report: {}", leased.info);
      return forward_failure<job_t>(leased);
    }
    auto& job = **leased.value;
    if (fail_locked(job, error, permanent, clock_())) {
      dead.push_back(job);
    }
    failed = job;
  }
  announce_dead_letters(dead);
  return make_success(std::move(failed), kCodespace);
}

operation_result<job_t> queue::requeue_dead_letter(std::string_view job_id) {
  auto lock = std::scoped_lock{mutex_};
  auto found = jobs_.find(job_id);
  if (found == std::end(jobs_)) {
    return make_failure<job_t>(error_code::job_not_found, kCodespace,
                               fmt::format("job {} does not exist", job_id));
  }
  auto& job = found->second;
  if (job.status != job_status_t::dlq) {
    return make_failure<job_t>(
        error_code::invalid_transition, kCodespace,
        fmt::format("job {} is {}, only dlq jobs can be requeued", job_id,
                    to_string(job.status)));
  }
  auto now = clock_();
  job.status = job_status_t::queued;
  job.attempt = 0;
  job.next_run_at = now;
  job.updated_at = now;
  spdlog::info("Job {} ({}) requeued from dead letter", job.job_id, job.type);
  return make_success(job, kCodespace);
}

std::optional<job_t> queue::find(std::string_view job_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto found = jobs_.find(job_id);
  if (found == std::end(jobs_)) {
    return std::nullopt;
  }
  return found->second;
}

std::vector<job_t> queue::list(std::optional<job_status_t> status) const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<job_t>{};
  for (const auto& [id, job] : jobs_) {
    if (!status || job.status == *status) {
      out.push_back(job);
    }
  }
  std::ranges::sort(out, {}, &job_t::sequence);
  return out;
}

std::optional<timestamp_milliseconds_t> queue::next_due() const {
  auto lock = std::scoped_lock{mutex_};
  auto due = std::optional<timestamp_milliseconds_t>{};
  for (const auto& [id, job] : jobs_) {
    if (job.status == job_status_t::queued &&
        (!due || job.next_run_at < *due)) {
      due = job.next_run_at;
    }
  }
  return due;
}

}  // namespace disburse::jobs
