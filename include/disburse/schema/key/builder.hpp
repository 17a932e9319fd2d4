#pragma once
#include <disburse/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace disburse::schema::key {

/// Byte key assembled left to right. Identifiers go through `hash` so every
/// key segment has a fixed width regardless of id length.
struct builder final {
  bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);

  /// Append the BLAKE3 digest of `str`.
  builder& hash(const std::string_view& str);

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
      data.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
    return *this;
  }
};

}  // namespace disburse::schema::key
