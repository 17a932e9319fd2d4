#pragma once

#include <disburse/schema/primitives.hpp>

#include <cstdint>
#include <functional>

namespace disburse::jobs {

/// Uniform draw in [0, 1).
using random_source_t = std::function<double()>;

struct backoff_policy final {
  schema::duration_milliseconds_t base{60'000};
  schema::duration_milliseconds_t cap{3'600'000};
  double jitter_ratio{0.10};
};

/// Delay before retry number `attempt` (1 based):
/// min(cap, base * 2^(attempt - 1)) plus jitter in [0, jitter_ratio) of it.
schema::duration_milliseconds_t compute_backoff(const backoff_policy& policy,
                                                uint32_t attempt,
                                                const random_source_t& random);

/// std::mt19937_64 seeded from std::random_device, guarded for sharing
/// between worker threads.
random_source_t default_random_source();

}  // namespace disburse::jobs
