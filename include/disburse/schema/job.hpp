#pragma once

#include <disburse/schema/enum_string.hpp>
#include <disburse/schema/job_status.hpp>
#include <disburse/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Schema type: job.
// Generic unit of asynchronous work. The payload is a flat, typed field map
// validated against the job type's registered declaration on enqueue.
namespace disburse::schema {

using payload_value_t = std::variant<std::string,
                                     int64_t,
                                     bool,
                                     std::vector<std::string>,
                                     std::map<std::string, std::string>>;
using job_payload_t = std::map<std::string, payload_value_t>;

enum class payload_kind_t : uint8_t {
  string = 0,
  integer = 1,
  boolean = 2,
  string_list = 3,
  string_map = 4
};

inline constexpr auto kPayloadKindMappings = std::array{
    std::pair<std::string_view, payload_kind_t>{"string",
                                                payload_kind_t::string},
    std::pair<std::string_view, payload_kind_t>{"integer",
                                                payload_kind_t::integer},
    std::pair<std::string_view, payload_kind_t>{"boolean",
                                                payload_kind_t::boolean},
    std::pair<std::string_view, payload_kind_t>{"string_list",
                                                payload_kind_t::string_list},
    std::pair<std::string_view, payload_kind_t>{"string_map",
                                                payload_kind_t::string_map}};

inline constexpr std::string_view to_string(const payload_kind_t value) {
  return to_string(value, kPayloadKindMappings).value_or("unknown");
}

/// Kind of the alternative currently held by `value`; variant order and
/// enum order are kept identical.
inline payload_kind_t kind_of(const payload_value_t& value) {
  return static_cast<payload_kind_t>(value.index());
}

inline constexpr auto kDefaultJobPriority = int32_t{50};

template <uint16_t Version>
struct job;

template <>
struct job<1> final {
  uint16_t version{1};
  entity_id_t job_id;
  std::string type;
  int32_t priority{kDefaultJobPriority};
  job_status_t status{job_status_t::queued};
  job_payload_t payload;
  uint32_t attempt{};
  uint32_t max_attempts{};
  timestamp_milliseconds_t next_run_at{};
  std::optional<timestamp_milliseconds_t> lease_expires_at;
  std::optional<std::string> worker_id;
  std::string last_error;
  uint64_t sequence{};
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t updated_at{};
};

using job_t = job<1>;

/// Typed payload accessors; std::nullopt when absent or of another kind.
std::optional<std::string> payload_string(const job_payload_t& payload,
                                          const std::string_view field);
std::optional<bool> payload_bool(const job_payload_t& payload,
                                 const std::string_view field);

}  // namespace disburse::schema
