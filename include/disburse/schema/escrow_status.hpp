#pragma once

#include <disburse/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: escrow status.
// locked and held are the active states, released and refunded are final.
namespace disburse::schema {

enum class escrow_status_t : uint8_t {
  locked = 0,
  held = 1,
  released = 2,
  refunded = 3
};

inline constexpr auto kEscrowStatusMappings = std::array{
    std::pair<std::string_view, escrow_status_t>{
        "locked", escrow_status_t::locked},
    std::pair<std::string_view, escrow_status_t>{
        "held", escrow_status_t::held},
    std::pair<std::string_view, escrow_status_t>{
        "released", escrow_status_t::released},
    std::pair<std::string_view, escrow_status_t>{
        "refunded", escrow_status_t::refunded}};

template <>
inline std::optional<escrow_status_t> try_from_string<escrow_status_t>(
    const std::string_view value) {
  return from_string(value, kEscrowStatusMappings);
}

inline constexpr std::string_view to_string(const escrow_status_t value) {
  return to_string(value, kEscrowStatusMappings).value_or("unknown");
}

/// At most one escrow per milestone may be in an active state.
constexpr bool is_active(const escrow_status_t value) {
  return value == escrow_status_t::locked || value == escrow_status_t::held;
}

}  // namespace disburse::schema
