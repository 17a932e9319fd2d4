#pragma once

#include <disburse/schema/primitives.hpp>
#include <functional>
#include <string_view>

namespace disburse::ports {

/// Produces a fresh identifier for the given prefix ("esc", "pay", ...).
using id_generator_t =
    std::function<schema::entity_id_t(std::string_view prefix)>;

/// Thread safe generator yielding "<prefix>_<16 hex digits>" from a shared
/// monotonic counter.
id_generator_t sequential_id_generator();

/// Same shape as sequential_id_generator but seeded from std::random_device,
/// so identifiers do not collide across process restarts.
id_generator_t random_id_generator();

}  // namespace disburse::ports
