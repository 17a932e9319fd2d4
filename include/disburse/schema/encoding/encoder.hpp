#pragma once
#include <disburse/schema/primitives.hpp>
#include <optional>

namespace disburse::schema::encoding {

// The wire library is picked at build time through the tag; nothing swaps
// encoders at runtime.
template <typename Library>
struct encoder {
  template <typename T>
  bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, bytes_t& out);

  template <typename T>
  T decode(const bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const bytes_view_t& bytes);
};

}  // namespace disburse::schema::encoding
