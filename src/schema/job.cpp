#include <disburse/schema/job.hpp>

namespace disburse::schema {

std::optional<std::string> payload_string(const job_payload_t& payload,
                                          const std::string_view field) {
  auto found = payload.find(std::string{field});
  if (found == std::end(payload)) {
    return std::nullopt;
  }
  if (const auto* value = std::get_if<std::string>(&found->second)) {
    return *value;
  }
  return std::nullopt;
}

std::optional<bool> payload_bool(const job_payload_t& payload,
                                 const std::string_view field) {
  auto found = payload.find(std::string{field});
  if (found == std::end(payload)) {
    return std::nullopt;
  }
  if (const auto* value = std::get_if<bool>(&found->second)) {
    return *value;
  }
  return std::nullopt;
}

}  // namespace disburse::schema
