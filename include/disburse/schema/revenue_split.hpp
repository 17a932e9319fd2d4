#pragma once

#include <disburse/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>

// Schema type: revenue split.
// One row of a project's split agreement. A row either names a resolvable
// recipient or only carries a placeholder label for a seat not yet filled.
namespace disburse::schema {

template <uint16_t Version>
struct revenue_split;

template <>
struct revenue_split<1> final {
  uint16_t version{1};
  std::optional<entity_id_t> recipient_id;
  std::string placeholder;
  std::optional<percent_t> percentage;
  std::optional<amount_t> fixed_amount;
};

using revenue_split_t = revenue_split<1>;

inline bool is_placeholder(const revenue_split_t& split) {
  return !split.recipient_id.has_value() || split.recipient_id->empty();
}

}  // namespace disburse::schema
