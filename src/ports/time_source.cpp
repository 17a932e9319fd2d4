#include <disburse/ports/time_source.hpp>
#include <chrono>

namespace disburse::ports {

time_source_t system_time_source() {
  return [] {
    return static_cast<schema::timestamp_milliseconds_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
  };
}

}  // namespace disburse::ports
