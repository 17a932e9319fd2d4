#include <disburse/jobs/backoff.hpp>
#include <algorithm>
#include <cmath>
#include <memory>
#include <mutex>
#include <random>

namespace disburse::jobs {

schema::duration_milliseconds_t compute_backoff(const backoff_policy& policy,
                                                const uint32_t attempt,
                                                const random_source_t& random) {
  auto exponent = std::min<uint32_t>(attempt == 0 ? 0 : attempt - 1, 32);
  auto delay = policy.base;
  for (uint32_t i = 0; i < exponent && delay < policy.cap; ++i) {
    delay *= 2;
  }
  delay = std::min(delay, policy.cap);

  auto draw = random ? std::clamp(random(), 0.0, 0.999999) : 0.0;
  auto jitter = static_cast<schema::duration_milliseconds_t>(
      std::floor(static_cast<double>(delay) * policy.jitter_ratio * draw));
  return delay + jitter;
}

random_source_t default_random_source() {
  struct state final {
    std::mutex mutex;
    std::mt19937_64 engine{std::random_device{}()};
    std::uniform_real_distribution<double> distribution{0.0, 1.0};
  };
  auto shared = std::make_shared<state>();
  return [shared] {
    auto lock = std::scoped_lock{shared->mutex};
    return shared->distribution(shared->engine);
  };
}

}  // namespace disburse::jobs
