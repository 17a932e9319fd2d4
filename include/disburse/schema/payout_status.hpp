#pragma once

#include <disburse/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: payout status.
// Shared by payout batches and their items.
namespace disburse::schema {

enum class payout_status_t : uint8_t {
  scheduled = 0,
  processing = 1,
  paid = 2,
  failed = 3
};

inline constexpr auto kPayoutStatusMappings = std::array{
    std::pair<std::string_view, payout_status_t>{
        "scheduled", payout_status_t::scheduled},
    std::pair<std::string_view, payout_status_t>{
        "processing", payout_status_t::processing},
    std::pair<std::string_view, payout_status_t>{
        "paid", payout_status_t::paid},
    std::pair<std::string_view, payout_status_t>{
        "failed", payout_status_t::failed}};

template <>
inline std::optional<payout_status_t> try_from_string<payout_status_t>(
    const std::string_view value) {
  return from_string(value, kPayoutStatusMappings);
}

inline constexpr std::string_view to_string(const payout_status_t value) {
  return to_string(value, kPayoutStatusMappings).value_or("unknown");
}

}  // namespace disburse::schema
