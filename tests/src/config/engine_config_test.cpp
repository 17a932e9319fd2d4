#include <gtest/gtest.h>
#include <disburse/config/engine_config.hpp>
#include <disburse/testing/common.hpp>

#include <fstream>
#include <string>
#include <vector>

namespace po = boost::program_options;

namespace {

po::variables_map parse(const std::vector<std::string>& args) {
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(args)
                .options(disburse::config::engine_options())
                .run(),
            vm);
  po::notify(vm);
  return vm;
}

}  // namespace

TEST(engine_config, empty_variables_map_yields_defaults) {
  auto config = disburse::config::make_engine_config(po::variables_map{});
  ASSERT_TRUE(config.ok()) << config.info;
  EXPECT_EQ(config.value->fee_rate_bps, 500u);
  EXPECT_EQ(config.value->placeholder_policy,
            disburse::schema::placeholder_policy_t::withhold);
  EXPECT_EQ(config.value->backoff.base, 60'000u);
  EXPECT_EQ(config.value->backoff.cap, 3'600'000u);
  EXPECT_DOUBLE_EQ(config.value->backoff.jitter_ratio, 0.10);
  EXPECT_EQ(config.value->lease_grace, 5'000u);
  EXPECT_EQ(config.value->worker_count, 4u);
  EXPECT_EQ(config.value->default_priority, 50);
}

TEST(engine_config, command_line_overrides_defaults) {
  auto config = disburse::config::make_engine_config(
      parse({"--fee-bps", "250", "--placeholder-policy", "renormalize",
             "--backoff-base-seconds", "2", "--backoff-cap-seconds", "30",
             "--workers", "8", "--poll-interval-ms", "100"}));
  ASSERT_TRUE(config.ok()) << config.info;
  EXPECT_EQ(config.value->fee_rate_bps, 250u);
  EXPECT_EQ(config.value->placeholder_policy,
            disburse::schema::placeholder_policy_t::renormalize);
  EXPECT_EQ(config.value->backoff.base, 2'000u);
  EXPECT_EQ(config.value->backoff.cap, 30'000u);
  EXPECT_EQ(config.value->worker_count, 8u);
  EXPECT_EQ(config.value->poll_interval, std::chrono::milliseconds{100});
}

TEST(engine_config, rejects_out_of_range_values) {
  const auto cases = std::vector<std::vector<std::string>>{
      {"--fee-bps", "10001"},
      {"--placeholder-policy", "split"},
      {"--workers", "0"},
      {"--backoff-base-seconds", "0"},
      {"--backoff-base-seconds", "120", "--backoff-cap-seconds", "60"},
      {"--jitter-ratio", "1.5"}};
  for (const auto& args : cases) {
    auto config = disburse::config::make_engine_config(parse(args));
    EXPECT_EQ(config.code, disburse::schema::error_code::invalid_argument)
        << args.front();
    EXPECT_EQ(config.codespace, disburse::config::kCodespace);
  }
}

TEST(engine_config, full_fee_is_allowed) {
  auto config =
      disburse::config::make_engine_config(parse({"--fee-bps", "10000"}));
  ASSERT_TRUE(config.ok()) << config.info;
  EXPECT_EQ(config.value->fee_rate_bps, 10'000u);
}

TEST(engine_config, file_values_yield_to_command_line) {
  const auto path = disburse::testing::make_db_path("disburse_config");
  {
    auto file = std::ofstream{path};
    file << "fee-bps = 300\n"
         << "workers = 3\n"
         << "placeholder-policy = renormalize\n";
  }
  auto description = disburse::config::engine_options();
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(std::vector<std::string>{"--workers", "6"})
                .options(description)
                .run(),
            vm);
  auto merged = disburse::config::merge_config_file(path, description, vm);
  ASSERT_TRUE(merged.ok()) << merged.info;

  auto config = disburse::config::make_engine_config(vm);
  ASSERT_TRUE(config.ok()) << config.info;
  EXPECT_EQ(config.value->fee_rate_bps, 300u);
  EXPECT_EQ(config.value->worker_count, 6u);
  EXPECT_EQ(config.value->placeholder_policy,
            disburse::schema::placeholder_policy_t::renormalize);
  disburse::testing::remove_path(path);
}

TEST(engine_config, unreadable_or_unknown_file_options_fail) {
  auto description = disburse::config::engine_options();
  auto vm = po::variables_map{};
  auto missing = disburse::config::merge_config_file(
      "/nonexistent/disburse.ini", description, vm);
  EXPECT_EQ(missing.code, disburse::schema::error_code::invalid_argument);

  const auto path = disburse::testing::make_db_path("disburse_config");
  {
    auto file = std::ofstream{path};
    file << "fee-percent = 5\n";
  }
  auto unknown = disburse::config::merge_config_file(path, description, vm);
  EXPECT_EQ(unknown.code, disburse::schema::error_code::invalid_argument);
  disburse::testing::remove_path(path);
}
