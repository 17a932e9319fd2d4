#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <boost/multiprecision/cpp_int.hpp>
#include <disburse/common/critical.hpp>
#include <disburse/split/calculator.hpp>
#include <algorithm>
#include <cstdlib>
#include <numeric>

using namespace disburse::schema;

namespace {

using wide_t = boost::multiprecision::int128_t;

// round_half_up(value * numerator / denominator) for non-negative inputs.
amount_t scale_half_up(const amount_t value,
                       const int64_t numerator,
                       const int64_t denominator) {
  auto product = wide_t{value} * numerator;
  auto rounded = (product * 2 + denominator) / (wide_t{denominator} * 2);
  return rounded.convert_to<amount_t>();
}

amount_t sum_net(const std::vector<recipient_share_t>& shares) {
  return std::accumulate(
      std::begin(shares), std::end(shares), amount_t{},
      [](const amount_t acc, const auto& share) {
        return acc + share.net_amount;
      });
}

}  // namespace

namespace disburse::split {

std::vector<amount_t> apportion(const amount_t pool,
                                const std::vector<percent_t>& weights) {
  auto total = std::accumulate(std::begin(weights), std::end(weights),
                               wide_t{});
  if (total <= 0 || pool < 0) {
    common::critical("apportion called with pool {} and weight total {}", pool,
                     total.str());
  }

  auto shares = std::vector<amount_t>(weights.size());
  auto remainders = std::vector<wide_t>(weights.size());
  auto floor_sum = amount_t{};
  for (std::size_t i = 0; i < weights.size(); ++i) {
    auto numerator = wide_t{pool} * weights[i];
    shares[i] = static_cast<amount_t>(numerator / total);
    remainders[i] = numerator % total;
    floor_sum += shares[i];
  }

  auto order = std::vector<std::size_t>(weights.size());
  std::iota(std::begin(order), std::end(order), std::size_t{});
  std::ranges::stable_sort(order, [&](const auto lhs, const auto rhs) {
    return remainders[lhs] > remainders[rhs];
  });

  auto residual = pool - floor_sum;
  if (residual < 0 || residual > static_cast<amount_t>(weights.size())) {
    common::critical("apportion residual {} out of range for {} entries",
                     residual, weights.size());
  }
  for (auto k = amount_t{}; k < residual; ++k) {
    shares[order[static_cast<std::size_t>(k)]] += 1;
  }
  return shares;
}

calculator::calculator(const basis_points_t fee_rate_bps)
    : fee_rate_bps_{fee_rate_bps} {}

basis_points_t calculator::fee_rate_bps() const {
  return fee_rate_bps_;
}

amount_t calculator::platform_fee(const amount_t gross) const {
  return scale_half_up(gross, fee_rate_bps_, kBasisPointScale);
}

operation_result<percent_t> calculator::validate(
    const std::vector<revenue_split_t>& splits) const {
  auto total = percent_t{};
  auto bearing = std::size_t{};
  for (const auto& split : splits) {
    if (!split.percentage) {
      continue;
    }
    ++bearing;
    if (*split.percentage < 0 || *split.percentage > kPercentScale) {
      return make_failure<percent_t>(
          error_code::percentage_out_of_range, kCodespace,
          fmt::format("percentage {} is outside [0, 100]",
                      format_percent(*split.percentage)));
    }
    total += *split.percentage;
  }
  if (bearing == 0) {
    return make_failure<percent_t>(error_code::percentage_model_required,
                                   kCodespace,
                                   "no split carries a percentage");
  }
  if (std::abs(total - kPercentScale) > kSplitSumTolerance) {
    return make_failure<percent_t>(
        error_code::split_sum_invalid, kCodespace,
        fmt::format("percentages sum to {}, expected 100",
                    format_percent(total)));
  }
  return make_success(total, kCodespace);
}

operation_result<split_breakdown_t> calculator::calculate(
    const amount_t gross,
    const std::string_view currency,
    const std::vector<revenue_split_t>& splits) const {
  if (gross <= 0) {
    return make_failure<split_breakdown_t>(
        error_code::invalid_amount, kCodespace,
        fmt::format("gross amount must be positive, got {}", gross));
  }
  if (!is_valid_currency(currency)) {
    return make_failure<split_breakdown_t>(
        error_code::invalid_currency, kCodespace,
        fmt::format("'{}' is not a three letter currency code", currency));
  }
  auto validated = validate(splits);
  if (!validated.ok()) {
    return forward_failure<split_breakdown_t>(validated);
  }

  auto breakdown = split_breakdown_t{};
  breakdown.gross_amount = gross;
  breakdown.currency = std::string{currency};
  breakdown.fee_rate_bps = fee_rate_bps_;
  breakdown.platform_fee = platform_fee(gross);
  breakdown.net_pool = gross - breakdown.platform_fee;

  auto weights = std::vector<percent_t>{};
  for (const auto& split : splits) {
    if (split.percentage) {
      weights.push_back(*split.percentage);
    }
  }
  auto nets = apportion(breakdown.net_pool, weights);

  auto index = std::size_t{};
  for (const auto& split : splits) {
    if (!split.percentage) {
      continue;
    }
    auto share = recipient_share_t{};
    share.recipient_id = split.recipient_id;
    share.placeholder = split.placeholder;
    share.percentage = *split.percentage;
    share.net_amount = nets[index++];
    share.gross_share = share.net_amount + share.tax_withheld;
    share.platform_fee_share =
        scale_half_up(breakdown.platform_fee, share.percentage, kPercentScale);
    breakdown.shares.push_back(std::move(share));
  }

  breakdown.total_distributed = sum_net(breakdown.shares);
  if (breakdown.total_distributed != breakdown.net_pool) {
    common::critical(
        "currency conservation violated: distributed {} of net pool {} "
        "(gross {} {})",
        breakdown.total_distributed, breakdown.net_pool, gross, currency);
  }
  spdlog::debug("Split {} {} into fee {} and {} share(s)", gross, currency,
                breakdown.platform_fee, breakdown.shares.size());
  return make_success(std::move(breakdown), kCodespace);
}

operation_result<settlement_t> calculator::settle(
    const amount_t gross,
    const std::string_view currency,
    const std::vector<revenue_split_t>& splits,
    const placeholder_policy_t policy) const {
  auto calculated = calculate(gross, currency, splits);
  if (!calculated.ok()) {
    return forward_failure<settlement_t>(calculated);
  }
  auto full = std::move(*calculated.value);

  auto result = settlement_t{};
  result.policy = policy;
  result.breakdown = full;
  result.breakdown.shares.clear();

  auto resolved = std::vector<recipient_share_t>{};
  auto withheld = amount_t{};
  for (auto& share : full.shares) {
    if (!share.recipient_id || share.recipient_id->empty()) {
      withheld += share.net_amount;
    } else {
      resolved.push_back(std::move(share));
    }
  }
  if (resolved.empty()) {
    return make_failure<settlement_t>(
        error_code::no_recipients, kCodespace,
        "every percentage-bearing split is a placeholder");
  }

  if (policy == placeholder_policy_t::renormalize) {
    auto weights = std::vector<percent_t>{};
    for (const auto& share : resolved) {
      weights.push_back(share.percentage);
    }
    auto weight_total =
        std::accumulate(std::begin(weights), std::end(weights), percent_t{});
    if (weight_total <= 0) {
      return make_failure<settlement_t>(
          error_code::no_recipients, kCodespace,
          "resolved recipients carry no percentage");
    }
    auto nets = apportion(full.net_pool, weights);
    for (std::size_t i = 0; i < resolved.size(); ++i) {
      resolved[i].net_amount = nets[i];
      resolved[i].gross_share = nets[i] + resolved[i].tax_withheld;
      resolved[i].platform_fee_share =
          scale_half_up(full.platform_fee, weights[i], weight_total);
    }
    withheld = 0;
  }

  result.breakdown.shares = std::move(resolved);
  result.breakdown.total_distributed = sum_net(result.breakdown.shares);
  result.withheld_amount = withheld;

  if (result.breakdown.platform_fee + result.breakdown.total_distributed +
          result.withheld_amount !=
      gross) {
    common::critical(
        "currency conservation violated: fee {} + net {} + withheld {} != "
        "gross {}",
        result.breakdown.platform_fee, result.breakdown.total_distributed,
        result.withheld_amount, gross);
  }
  return make_success(std::move(result), kCodespace);
}

}  // namespace disburse::split
