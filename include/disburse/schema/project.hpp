#pragma once

#include <disburse/schema/primitives.hpp>
#include <disburse/schema/revenue_split.hpp>

#include <cstdint>
#include <vector>

// Schema type: project.
// Aggregate root for membership and the active revenue split agreement.
namespace disburse::schema {

template <uint16_t Version>
struct project;

template <>
struct project<1> final {
  uint16_t version{1};
  entity_id_t project_id;
  entity_id_t owner_id;
  std::vector<entity_id_t> member_ids;
  std::vector<revenue_split_t> splits;
  uint64_t revision{};
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t updated_at{};
};

using project_t = project<1>;

}  // namespace disburse::schema
