#pragma once

#include <disburse/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: webhook outcome.
namespace disburse::schema {

enum class webhook_outcome_t : uint8_t {
  applied = 0,
  duplicate = 1,
  ignored = 2
};

inline constexpr auto kWebhookOutcomeMappings = std::array{
    std::pair<std::string_view, webhook_outcome_t>{
        "applied", webhook_outcome_t::applied},
    std::pair<std::string_view, webhook_outcome_t>{
        "duplicate", webhook_outcome_t::duplicate},
    std::pair<std::string_view, webhook_outcome_t>{
        "ignored", webhook_outcome_t::ignored}};

template <>
inline std::optional<webhook_outcome_t> try_from_string<webhook_outcome_t>(
    const std::string_view value) {
  return from_string(value, kWebhookOutcomeMappings);
}

inline constexpr std::string_view to_string(const webhook_outcome_t value) {
  return to_string(value, kWebhookOutcomeMappings).value_or("unknown");
}

}  // namespace disburse::schema
