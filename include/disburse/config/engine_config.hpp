#pragma once

#include <disburse/jobs/backoff.hpp>
#include <disburse/schema/job.hpp>
#include <disburse/schema/operation_result.hpp>
#include <disburse/schema/placeholder_policy.hpp>
#include <disburse/schema/primitives.hpp>

#include <boost/program_options.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace disburse::config {

inline constexpr auto kCodespace = std::string_view{"disburse.config"};

/// Tunables of one settlement engine instance.
struct engine_config final {
  schema::basis_points_t fee_rate_bps{schema::kDefaultFeeRateBps};
  schema::placeholder_policy_t placeholder_policy{
      schema::placeholder_policy_t::withhold};
  jobs::backoff_policy backoff{};
  schema::duration_milliseconds_t lease_grace{5'000};
  uint32_t worker_count{4};
  std::chrono::milliseconds poll_interval{250};
  int32_t default_priority{schema::kDefaultJobPriority};
};

/// Options understood on the command line and in a `--config` file. Every
/// option has a default, so an empty variables_map yields the defaults.
boost::program_options::options_description engine_options();

/// Read `path` (INI style, `fee-bps = 250`) into `vm`. Values already in `vm`
/// win, so store the command line first. Fails `invalid_argument` when the
/// file cannot be read or names an unknown option.
schema::operation_result<bool> merge_config_file(
    const std::string& path,
    const boost::program_options::options_description& description,
    boost::program_options::variables_map& vm);

/// Validate the parsed options. Fails `invalid_argument` for a fee outside
/// [0, 10000] bps, an unknown placeholder policy, zero workers or an
/// inconsistent backoff.
schema::operation_result<engine_config> make_engine_config(
    const boost::program_options::variables_map& vm);

}  // namespace disburse::config
