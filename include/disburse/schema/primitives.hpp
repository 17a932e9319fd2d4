#pragma once
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace disburse::schema {

using amount_t = int64_t;           // Minor currency units (cents, paise).
using percent_t = int64_t;          // Fixed point, kPercentScale == 100%.
using basis_points_t = uint32_t;    // kBasisPointScale == 100%.
using entity_id_t = std::string;
using currency_t = std::string;
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;
using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;

inline constexpr auto kPercentScale = percent_t{1'000'000};
inline constexpr auto kPercentUnitsPerPoint = percent_t{10'000};
inline constexpr auto kPercentFractionDigits = std::size_t{4};
inline constexpr auto kSplitSumTolerance = percent_t{100};  // 0.01 points.
inline constexpr auto kBasisPointScale = basis_points_t{10'000};
inline constexpr auto kDefaultFeeRateBps = basis_points_t{500};

struct money final {
  amount_t amount{};
  currency_t currency;
};

using money_t = money;

/// True for an upper-case three letter ISO-4217 style code.
bool is_valid_currency(const std::string_view currency);

/// Parse decimal percentage text such as "33.33" exactly.
///
/// At most four fractional digits are accepted; anything else (signs,
/// exponents, stray characters) yields std::nullopt.
std::optional<percent_t> try_parse_percent(const std::string_view text);

/// Convert a floating percentage (e.g. 33.33) to fixed point, rounding half
/// up to the nearest representable unit.
std::optional<percent_t> try_percent_from_double(const double value);

constexpr percent_t make_percent(const int64_t whole_points) {
  return whole_points * kPercentUnitsPerPoint;
}

/// Render a fixed point percentage without trailing zeros ("33.33").
std::string format_percent(const percent_t value);

/// Render minor units as a decimal major-unit string ("123.45").
std::string format_amount(const amount_t value);

}  // namespace disburse::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
