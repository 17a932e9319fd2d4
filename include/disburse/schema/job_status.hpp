#pragma once

#include <disburse/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: job status.
namespace disburse::schema {

enum class job_status_t : uint8_t {
  queued = 0,
  leased = 1,
  succeeded = 2,
  failed = 3,
  dlq = 4
};

inline constexpr auto kJobStatusMappings = std::array{
    std::pair<std::string_view, job_status_t>{
        "queued", job_status_t::queued},
    std::pair<std::string_view, job_status_t>{
        "leased", job_status_t::leased},
    std::pair<std::string_view, job_status_t>{
        "succeeded", job_status_t::succeeded},
    std::pair<std::string_view, job_status_t>{
        "failed", job_status_t::failed},
    std::pair<std::string_view, job_status_t>{
        "dlq", job_status_t::dlq}};

template <>
inline std::optional<job_status_t> try_from_string<job_status_t>(
    const std::string_view value) {
  return from_string(value, kJobStatusMappings);
}

inline constexpr std::string_view to_string(const job_status_t value) {
  return to_string(value, kJobStatusMappings).value_or("unknown");
}

}  // namespace disburse::schema
