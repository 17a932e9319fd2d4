#pragma once

#include <disburse/schema/primitives.hpp>
#include <functional>

namespace disburse::ports {

/// Wall clock in milliseconds since the Unix epoch.
using time_source_t = std::function<schema::timestamp_milliseconds_t()>;

time_source_t system_time_source();

}  // namespace disburse::ports
