#pragma once

#include <disburse/ports/time_source.hpp>
#include <disburse/schema/primitives.hpp>
#include <disburse/schema/revenue_split.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace disburse::testing {

/// Clock the test moves by hand; copies share the same reading.
class manual_clock final {
 public:
  explicit manual_clock(const disburse::schema::timestamp_milliseconds_t start =
                            1'700'000'000'000)
      : now_{std::make_shared<std::atomic<uint64_t>>(start)} {}

  disburse::schema::timestamp_milliseconds_t now() const { return *now_; }

  void advance(const disburse::schema::duration_milliseconds_t by) {
    *now_ += by;
  }

  disburse::ports::time_source_t source() const {
    return [now = now_] { return now->load(); };
  }

 private:
  std::shared_ptr<std::atomic<uint64_t>> now_;
};

inline disburse::schema::percent_t percent(const std::string_view text) {
  auto parsed = disburse::schema::try_parse_percent(text);
  if (!parsed) {
    throw std::invalid_argument{std::string{text}};
  }
  return *parsed;
}

inline disburse::schema::revenue_split_t make_split(
    const std::string_view recipient_id,
    const std::string_view percentage) {
  auto split = disburse::schema::revenue_split_t{};
  split.recipient_id = std::string{recipient_id};
  split.percentage = percent(percentage);
  return split;
}

inline disburse::schema::revenue_split_t make_placeholder(
    const std::string_view label,
    const std::string_view percentage) {
  auto split = disburse::schema::revenue_split_t{};
  split.placeholder = std::string{label};
  split.percentage = percent(percentage);
  return split;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace disburse::testing
