#pragma once

#include <disburse/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace disburse::schema {

// Numbering is grouped by category; values are persisted in job errors and
// surfaced to API callers, so existing numbers never change.
enum class error_code : uint32_t {
  ok = 0,

  percentage_model_required = 1,
  split_sum_invalid = 2,
  percentage_out_of_range = 3,
  invalid_amount = 4,
  invalid_currency = 5,
  correlation_missing = 6,
  invalid_webhook_signature = 7,
  malformed_webhook = 8,
  invalid_argument = 9,
  no_recipients = 10,

  escrow_already_active = 20,
  already_processed = 21,
  already_scheduled = 22,
  invalid_transition = 23,
  version_conflict = 24,
  not_funded = 25,
  milestone_not_completed = 26,

  project_not_found = 40,
  milestone_not_found = 41,
  escrow_not_found = 42,
  batch_not_found = 43,
  transaction_not_found = 44,
  job_not_found = 45,

  permission_denied = 60,

  job_type_not_found = 80,
  schema_validation_failed = 81,
  job_not_leased = 82,
  job_not_enqueued = 83,

  gateway_request_failed = 100,
};

enum class error_category_t : uint8_t {
  none = 0,
  validation = 1,
  conflict = 2,
  not_found = 3,
  permission = 4,
  job = 5,
  gateway = 6
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code>{"ok", error_code::ok},
    std::pair<std::string_view, error_code>{
        "percentage_model_required", error_code::percentage_model_required},
    std::pair<std::string_view, error_code>{"split_sum_invalid",
                                            error_code::split_sum_invalid},
    std::pair<std::string_view, error_code>{
        "percentage_out_of_range", error_code::percentage_out_of_range},
    std::pair<std::string_view, error_code>{"invalid_amount",
                                            error_code::invalid_amount},
    std::pair<std::string_view, error_code>{"invalid_currency",
                                            error_code::invalid_currency},
    std::pair<std::string_view, error_code>{"correlation_missing",
                                            error_code::correlation_missing},
    std::pair<std::string_view, error_code>{
        "invalid_webhook_signature", error_code::invalid_webhook_signature},
    std::pair<std::string_view, error_code>{"malformed_webhook",
                                            error_code::malformed_webhook},
    std::pair<std::string_view, error_code>{"invalid_argument",
                                            error_code::invalid_argument},
    std::pair<std::string_view, error_code>{"no_recipients",
                                            error_code::no_recipients},
    std::pair<std::string_view, error_code>{"escrow_already_active",
                                            error_code::escrow_already_active},
    std::pair<std::string_view, error_code>{"already_processed",
                                            error_code::already_processed},
    std::pair<std::string_view, error_code>{"already_scheduled",
                                            error_code::already_scheduled},
    std::pair<std::string_view, error_code>{"invalid_transition",
                                            error_code::invalid_transition},
    std::pair<std::string_view, error_code>{"version_conflict",
                                            error_code::version_conflict},
    std::pair<std::string_view, error_code>{"not_funded",
                                            error_code::not_funded},
    std::pair<std::string_view, error_code>{
        "milestone_not_completed", error_code::milestone_not_completed},
    std::pair<std::string_view, error_code>{"project_not_found",
                                            error_code::project_not_found},
    std::pair<std::string_view, error_code>{"milestone_not_found",
                                            error_code::milestone_not_found},
    std::pair<std::string_view, error_code>{"escrow_not_found",
                                            error_code::escrow_not_found},
    std::pair<std::string_view, error_code>{"batch_not_found",
                                            error_code::batch_not_found},
    std::pair<std::string_view, error_code>{"transaction_not_found",
                                            error_code::transaction_not_found},
    std::pair<std::string_view, error_code>{"job_not_found",
                                            error_code::job_not_found},
    std::pair<std::string_view, error_code>{"permission_denied",
                                            error_code::permission_denied},
    std::pair<std::string_view, error_code>{"job_type_not_found",
                                            error_code::job_type_not_found},
    std::pair<std::string_view, error_code>{
        "schema_validation_failed", error_code::schema_validation_failed},
    std::pair<std::string_view, error_code>{"job_not_leased",
                                            error_code::job_not_leased},
    std::pair<std::string_view, error_code>{"job_not_enqueued",
                                            error_code::job_not_enqueued},
    std::pair<std::string_view, error_code>{
        "gateway_request_failed", error_code::gateway_request_failed}};

template <>
inline std::optional<error_code> try_from_string<error_code>(
    const std::string_view value) {
  return from_string(value, kErrorCodeMappings);
}

inline constexpr std::string_view to_string(const error_code value) {
  return to_string(value, kErrorCodeMappings).value_or("unknown");
}

constexpr error_category_t category_of(const error_code value) {
  const auto raw = static_cast<uint32_t>(value);
  if (raw == 0) {
    return error_category_t::none;
  }
  if (raw < 20) {
    return error_category_t::validation;
  }
  if (raw < 40) {
    return error_category_t::conflict;
  }
  if (raw < 60) {
    return error_category_t::not_found;
  }
  if (raw < 80) {
    return error_category_t::permission;
  }
  if (raw < 100) {
    return error_category_t::job;
  }
  return error_category_t::gateway;
}

}  // namespace disburse::schema
