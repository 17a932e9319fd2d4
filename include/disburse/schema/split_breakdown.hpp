#pragma once

#include <disburse/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: split breakdown.
// Result of the split calculation: the platform fee and one share per
// percentage-bearing split row, in input order.
namespace disburse::schema {

template <uint16_t Version>
struct recipient_share;

template <>
struct recipient_share<1> final {
  uint16_t version{1};
  std::optional<entity_id_t> recipient_id;
  std::string placeholder;
  percent_t percentage{};
  amount_t gross_share{};
  amount_t platform_fee_share{};
  amount_t tax_withheld{};
  amount_t net_amount{};
};

using recipient_share_t = recipient_share<1>;

template <uint16_t Version>
struct split_breakdown;

template <>
struct split_breakdown<1> final {
  uint16_t version{1};
  amount_t gross_amount{};
  currency_t currency;
  basis_points_t fee_rate_bps{};
  amount_t platform_fee{};
  amount_t tax_withheld{};
  amount_t net_pool{};
  amount_t total_distributed{};
  std::vector<recipient_share_t> shares;
};

using split_breakdown_t = split_breakdown<1>;

}  // namespace disburse::schema
