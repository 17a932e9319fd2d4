#include <fmt/format.h>
#include <disburse/ports/id_generator.hpp>
#include <atomic>
#include <memory>
#include <random>

namespace disburse::ports {

namespace {

id_generator_t counter_generator(const uint64_t seed) {
  auto counter = std::make_shared<std::atomic<uint64_t>>(seed);
  return [counter](const std::string_view prefix) {
    return fmt::format("{}_{:016x}", prefix, ++(*counter));
  };
}

}  // namespace

id_generator_t sequential_id_generator() {
  return counter_generator(0);
}

id_generator_t random_id_generator() {
  auto device = std::random_device{};
  auto seed = (static_cast<uint64_t>(device()) << 32) | device();
  // Leave headroom so the counter does not wrap.
  return counter_generator(seed >> 1);
}

}  // namespace disburse::ports
