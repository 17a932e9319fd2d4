#pragma once

#include <disburse/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: placeholder policy.
// What happens to the share of a split row without a resolvable recipient.
namespace disburse::schema {

enum class placeholder_policy_t : uint8_t {
  withhold = 0,
  renormalize = 1
};

inline constexpr auto kPlaceholderPolicyMappings = std::array{
    std::pair<std::string_view, placeholder_policy_t>{
        "withhold", placeholder_policy_t::withhold},
    std::pair<std::string_view, placeholder_policy_t>{
        "renormalize", placeholder_policy_t::renormalize}};

template <>
inline std::optional<placeholder_policy_t> try_from_string<placeholder_policy_t>(
    const std::string_view value) {
  return from_string(value, kPlaceholderPolicyMappings);
}

inline constexpr std::string_view to_string(const placeholder_policy_t value) {
  return to_string(value, kPlaceholderPolicyMappings).value_or("unknown");
}

}  // namespace disburse::schema
