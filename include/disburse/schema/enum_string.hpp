#pragma once

#include <algorithm>
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace disburse::schema {

template <typename Enum, std::size_t N>
using enum_mappings_t = std::array<std::pair<std::string_view, Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const enum_mappings_t<Enum, N>& mappings) {
  auto found = std::ranges::find_if(
      mappings, [&](const auto& entry) { return entry.first == value; });
  if (found == std::end(mappings)) {
    return std::nullopt;
  }
  return found->second;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const enum_mappings_t<Enum, N>& mappings) {
  auto found = std::ranges::find_if(
      mappings, [&](const auto& entry) { return entry.second == value; });
  if (found == std::end(mappings)) {
    return std::nullopt;
  }
  return found->first;
}

/// Join every mapped name with `separator`, e.g. "withhold|renormalize".
template <typename Enum, std::size_t N>
std::string join_names(const enum_mappings_t<Enum, N>& mappings,
                       const std::string_view separator = "|") {
  auto joined = std::string{};
  for (const auto& [name, enum_value] : mappings) {
    if (!joined.empty()) {
      joined.append(separator);
    }
    joined.append(name);
  }
  return joined;
}

/// Specialised next to every enum that carries a mapping table.
template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value) {
  static_cast<void>(value);
  return std::nullopt;
}

}  // namespace disburse::schema
