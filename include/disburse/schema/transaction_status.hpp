#pragma once

#include <disburse/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: payment transaction status.
// failed and refunded are final; succeeded only moves on to refunded.
namespace disburse::schema {

enum class transaction_status_t : uint8_t {
  created = 0,
  pending = 1,
  succeeded = 2,
  failed = 3,
  refunded = 4
};

inline constexpr auto kTransactionStatusMappings = std::array{
    std::pair<std::string_view, transaction_status_t>{
        "created", transaction_status_t::created},
    std::pair<std::string_view, transaction_status_t>{
        "pending", transaction_status_t::pending},
    std::pair<std::string_view, transaction_status_t>{
        "succeeded", transaction_status_t::succeeded},
    std::pair<std::string_view, transaction_status_t>{
        "failed", transaction_status_t::failed},
    std::pair<std::string_view, transaction_status_t>{
        "refunded", transaction_status_t::refunded}};

template <>
inline std::optional<transaction_status_t> try_from_string<transaction_status_t>(
    const std::string_view value) {
  return from_string(value, kTransactionStatusMappings);
}

inline constexpr std::string_view to_string(const transaction_status_t value) {
  return to_string(value, kTransactionStatusMappings).value_or("unknown");
}

constexpr bool is_terminal(const transaction_status_t value) {
  return value == transaction_status_t::succeeded ||
         value == transaction_status_t::failed ||
         value == transaction_status_t::refunded;
}

}  // namespace disburse::schema
