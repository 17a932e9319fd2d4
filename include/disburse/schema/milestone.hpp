#pragma once

#include <disburse/schema/milestone_status.hpp>
#include <disburse/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>

// Schema type: milestone.
namespace disburse::schema {

template <uint16_t Version>
struct milestone;

template <>
struct milestone<1> final {
  uint16_t version{1};
  entity_id_t milestone_id;
  entity_id_t project_id;
  std::string title;
  amount_t amount{};
  currency_t currency;
  milestone_status_t status{milestone_status_t::pending};
  std::optional<entity_id_t> escrow_id;
  std::string dispute_reason;
  uint64_t revision{};
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t updated_at{};
};

using milestone_t = milestone<1>;

}  // namespace disburse::schema
