#include <fmt/format.h>
#include <disburse/schema/primitives.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace disburse::schema {

namespace {

constexpr auto kMaxIntegerDigits = std::size_t{12};

bool is_digit(const char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

bool is_valid_currency(const std::string_view currency) {
  return currency.size() == 3 &&
         std::ranges::all_of(currency, [](const char c) {
           return c >= 'A' && c <= 'Z';
         });
}

std::optional<percent_t> try_parse_percent(const std::string_view text) {
  auto dot = text.find('.');
  auto whole = text.substr(0, dot);
  auto fraction = dot == std::string_view::npos ? std::string_view{}
                                                : text.substr(dot + 1);
  if (whole.empty() && fraction.empty()) {
    return std::nullopt;
  }
  if (whole.size() > kMaxIntegerDigits ||
      fraction.size() > kPercentFractionDigits) {
    return std::nullopt;
  }
  if (!std::ranges::all_of(whole, is_digit) ||
      !std::ranges::all_of(fraction, is_digit)) {
    return std::nullopt;
  }

  auto value = percent_t{};
  for (const auto c : whole) {
    value = value * 10 + (c - '0');
  }
  value *= kPercentUnitsPerPoint;

  auto scale = kPercentUnitsPerPoint;
  for (const auto c : fraction) {
    scale /= 10;
    value += (c - '0') * scale;
  }
  return value;
}

std::optional<percent_t> try_percent_from_double(const double value) {
  if (!std::isfinite(value) || value < 0.0) {
    return std::nullopt;
  }
  auto scaled = value * static_cast<double>(kPercentUnitsPerPoint);
  if (scaled >= static_cast<double>(std::numeric_limits<percent_t>::max())) {
    return std::nullopt;
  }
  return static_cast<percent_t>(std::floor(scaled + 0.5));
}

std::string format_percent(const percent_t value) {
  auto sign = value < 0 ? "-" : "";
  auto magnitude = value < 0 ? -value : value;
  auto text = fmt::format("{}{}.{:04}", sign, magnitude / kPercentUnitsPerPoint,
                          magnitude % kPercentUnitsPerPoint);
  while (text.back() == '0') {
    text.pop_back();
  }
  if (text.back() == '.') {
    text.pop_back();
  }
  return text;
}

std::string format_amount(const amount_t value) {
  auto sign = value < 0 ? "-" : "";
  auto magnitude = value < 0 ? -value : value;
  return fmt::format("{}{}.{:02}", sign, magnitude / 100, magnitude % 100);
}

}  // namespace disburse::schema
