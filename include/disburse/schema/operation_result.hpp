#pragma once

#include <disburse/schema/error_code.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace disburse::schema {

/// Outcome of an engine operation.
///
/// Mirrors the result envelope API callers receive: a numeric code, the
/// code's short name in `log`, a human readable `info` and the subsystem
/// `codespace`. `value` is populated only when `code == error_code::ok`.
template <typename T>
struct operation_result final {
  error_code code{error_code::ok};
  std::string log;
  std::string info;
  std::string codespace;
  std::optional<T> value;

  bool ok() const { return code == error_code::ok; }
};

template <typename T>
operation_result<T> make_success(T value, const std::string_view codespace) {
  auto result = operation_result<T>{};
  result.code = error_code::ok;
  result.codespace = std::string{codespace};
  result.value = std::move(value);
  return result;
}

template <typename T>
operation_result<T> make_failure(const error_code code,
                                 const std::string_view codespace,
                                 std::string info) {
  auto result = operation_result<T>{};
  result.code = code;
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

/// Re-type a failed result, keeping its code, messages and codespace.
template <typename T, typename U>
operation_result<T> forward_failure(const operation_result<U>& failed) {
  auto result = operation_result<T>{};
  result.code = failed.code;
  result.log = failed.log;
  result.info = failed.info;
  result.codespace = failed.codespace;
  return result;
}

}  // namespace disburse::schema
