#pragma once

#include <disburse/schema/operation_result.hpp>
#include <disburse/schema/placeholder_policy.hpp>
#include <disburse/schema/primitives.hpp>
#include <disburse/schema/revenue_split.hpp>
#include <disburse/schema/split_breakdown.hpp>

#include <string_view>
#include <vector>

namespace disburse::split {

inline constexpr auto kCodespace = std::string_view{"disburse.split"};

/// Breakdown restricted to the recipients a payout can actually be sent to.
struct settlement final {
  schema::split_breakdown_t breakdown;
  schema::amount_t withheld_amount{};
  schema::placeholder_policy_t policy{schema::placeholder_policy_t::withhold};
};

using settlement_t = settlement;

/// Largest remainder (Hamilton) apportionment of `pool` minor units.
///
/// Each entry receives floor(pool * weight / total) and the leftover units go
/// one each to the entries with the largest remainders; ties keep input
/// order. `total` is the sum of `weights` and must be positive. The result
/// always sums to `pool` and never deviates from an exact share by one unit
/// or more.
std::vector<schema::amount_t> apportion(
    schema::amount_t pool,
    const std::vector<schema::percent_t>& weights);

/// Deterministic, currency conserving revenue split calculator.
///
/// Stateless apart from the configured fee rate; safe to share between
/// threads.
class calculator final {
 public:
  explicit calculator(
      schema::basis_points_t fee_rate_bps = schema::kDefaultFeeRateBps);

  schema::basis_points_t fee_rate_bps() const;

  /// round_half_up(gross * fee rate).
  schema::amount_t platform_fee(schema::amount_t gross) const;

  /// Check the percentage-bearing rows of a split set.
  ///
  /// Returns the percentage total on success. Fails
  /// `percentage_model_required` when no row carries a percentage,
  /// `percentage_out_of_range` for a row outside [0, 100] and
  /// `split_sum_invalid` when the total misses 100 by more than 0.01.
  schema::operation_result<schema::percent_t> validate(
      const std::vector<schema::revenue_split_t>& splits) const;

  /// Split `gross` into the platform fee and one net share per
  /// percentage-bearing row (placeholders included), in input order.
  schema::operation_result<schema::split_breakdown_t> calculate(
      schema::amount_t gross,
      std::string_view currency,
      const std::vector<schema::revenue_split_t>& splits) const;

  /// Calculate for payout: placeholder rows are removed according to
  /// `policy`. Fails `no_recipients` when no resolvable recipient remains.
  schema::operation_result<settlement_t> settle(
      schema::amount_t gross,
      std::string_view currency,
      const std::vector<schema::revenue_split_t>& splits,
      schema::placeholder_policy_t policy) const;

 private:
  schema::basis_points_t fee_rate_bps_;
};

}  // namespace disburse::split
