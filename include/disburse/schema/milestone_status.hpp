#pragma once

#include <disburse/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: milestone status.
// Lifecycle: pending -> funded -> completed -> approved, with disputed and
// rejected as the contested branch.
namespace disburse::schema {

enum class milestone_status_t : uint8_t {
  pending = 0,
  funded = 1,
  completed = 2,
  approved = 3,
  disputed = 4,
  rejected = 5
};

inline constexpr auto kMilestoneStatusMappings = std::array{
    std::pair<std::string_view, milestone_status_t>{
        "pending", milestone_status_t::pending},
    std::pair<std::string_view, milestone_status_t>{
        "funded", milestone_status_t::funded},
    std::pair<std::string_view, milestone_status_t>{
        "completed", milestone_status_t::completed},
    std::pair<std::string_view, milestone_status_t>{
        "approved", milestone_status_t::approved},
    std::pair<std::string_view, milestone_status_t>{
        "disputed", milestone_status_t::disputed},
    std::pair<std::string_view, milestone_status_t>{
        "rejected", milestone_status_t::rejected}};

template <>
inline std::optional<milestone_status_t> try_from_string<milestone_status_t>(
    const std::string_view value) {
  return from_string(value, kMilestoneStatusMappings);
}

inline constexpr std::string_view to_string(const milestone_status_t value) {
  return to_string(value, kMilestoneStatusMappings).value_or("unknown");
}

}  // namespace disburse::schema
