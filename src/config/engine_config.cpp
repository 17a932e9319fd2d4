#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <disburse/config/engine_config.hpp>
#include <fstream>

using namespace disburse::schema;
namespace po = boost::program_options;

namespace disburse::config {

namespace {

template <typename T>
T value_or(const po::variables_map& vm, const char* name, T fallback) {
  if (!vm.contains(name)) {
    return fallback;
  }
  return vm[name].as<T>();
}

operation_result<engine_config> rejected(std::string info) {
  spdlog::error("Invalid configuration: {}", info);
  return make_failure<engine_config>(error_code::invalid_argument, kCodespace,
                                     std::move(info));
}

}  // namespace

po::options_description engine_options() {
  auto defaults = engine_config{};
  auto description = po::options_description{"Engine"};
  description.add_options()(
      "fee-bps", po::value<uint32_t>()->default_value(defaults.fee_rate_bps),
      "Platform fee in basis points")(
      "placeholder-policy",
      po::value<std::string>()->default_value(
          std::string{to_string(defaults.placeholder_policy)}),
      "Share of placeholder split rows: withhold or renormalize")(
      "backoff-base-seconds",
      po::value<uint32_t>()->default_value(
          static_cast<uint32_t>(defaults.backoff.base / 1'000)),
      "First retry delay")(
      "backoff-cap-seconds",
      po::value<uint32_t>()->default_value(
          static_cast<uint32_t>(defaults.backoff.cap / 1'000)),
      "Longest retry delay")(
      "jitter-ratio",
      po::value<double>()->default_value(defaults.backoff.jitter_ratio),
      "Random extra delay as a fraction of the backoff")(
      "lease-grace-seconds",
      po::value<uint32_t>()->default_value(
          static_cast<uint32_t>(defaults.lease_grace / 1'000)),
      "Slack added to a job timeout before its lease expires")(
      "workers", po::value<uint32_t>()->default_value(defaults.worker_count),
      "Job worker threads")(
      "poll-interval-ms",
      po::value<uint32_t>()->default_value(
          static_cast<uint32_t>(defaults.poll_interval.count())),
      "Idle worker poll interval")(
      "default-priority",
      po::value<int32_t>()->default_value(defaults.default_priority),
      "Priority of jobs enqueued without one");
  return description;
}

operation_result<bool> merge_config_file(const std::string& path,
                                         const po::options_description& description,
                                         po::variables_map& vm) {
  auto file = std::ifstream{path};
  if (!file) {
    return make_failure<bool>(error_code::invalid_argument, kCodespace,
                              fmt::format("cannot read config file {}", path));
  }
  try {
    po::store(po::parse_config_file(file, description), vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    return make_failure<bool>(error_code::invalid_argument, kCodespace,
                              fmt::format("{}: {}", path, ex.what()));
  }
  spdlog::debug("Loaded configuration from {}", path);
  return make_success(true, kCodespace);
}

operation_result<engine_config> make_engine_config(const po::variables_map& vm) {
  auto out = engine_config{};

  auto fee = value_or<uint32_t>(vm, "fee-bps", out.fee_rate_bps);
  if (fee > kBasisPointScale) {
    return rejected(fmt::format("fee-bps {} is outside [0, {}]", fee,
                                kBasisPointScale));
  }
  out.fee_rate_bps = static_cast<basis_points_t>(fee);

  auto policy_name = value_or<std::string>(
      vm, "placeholder-policy", std::string{to_string(out.placeholder_policy)});
  auto policy = try_from_string<placeholder_policy_t>(policy_name);
  if (!policy) {
    return rejected(fmt::format("unknown placeholder-policy '{}', expected {}",
                                policy_name,
                                join_names(kPlaceholderPolicyMappings)));
  }
  out.placeholder_policy = *policy;

  auto base = value_or<uint32_t>(vm, "backoff-base-seconds",
                                 static_cast<uint32_t>(out.backoff.base / 1'000));
  auto cap = value_or<uint32_t>(vm, "backoff-cap-seconds",
                                static_cast<uint32_t>(out.backoff.cap / 1'000));
  if (base == 0 || cap < base) {
    return rejected(fmt::format(
        "backoff needs 0 < base ({} s) <= cap ({} s)", base, cap));
  }
  out.backoff.base = duration_milliseconds_t{base} * 1'000;
  out.backoff.cap = duration_milliseconds_t{cap} * 1'000;

  auto jitter = value_or<double>(vm, "jitter-ratio", out.backoff.jitter_ratio);
  if (jitter < 0.0 || jitter >= 1.0) {
    return rejected(fmt::format("jitter-ratio {} is outside [0, 1)", jitter));
  }
  out.backoff.jitter_ratio = jitter;

  out.lease_grace =
      duration_milliseconds_t{value_or<uint32_t>(
          vm, "lease-grace-seconds",
          static_cast<uint32_t>(out.lease_grace / 1'000))} *
      1'000;

  out.worker_count = value_or<uint32_t>(vm, "workers", out.worker_count);
  if (out.worker_count == 0) {
    return rejected("workers must be at least 1");
  }
  out.poll_interval = std::chrono::milliseconds{value_or<uint32_t>(
      vm, "poll-interval-ms",
      static_cast<uint32_t>(out.poll_interval.count()))};
  out.default_priority =
      value_or<int32_t>(vm, "default-priority", out.default_priority);
  return make_success(std::move(out), kCodespace);
}

}  // namespace disburse::config
