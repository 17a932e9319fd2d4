#pragma once

#include <disburse/schema/job.hpp>
#include <disburse/schema/operation_result.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace disburse::jobs {

inline constexpr auto kCodespace = std::string_view{"disburse.jobs"};

struct job_policy final {
  uint32_t max_attempts{1};
  uint32_t timeout_seconds{60};
  std::optional<uint32_t> concurrency_limit;
};

struct field_spec final {
  std::string name;
  schema::payload_kind_t kind{schema::payload_kind_t::string};
  bool required{true};
};

struct job_definition final {
  std::string type;
  std::vector<field_spec> fields;
  job_policy policy;
};

/// Registered job types with their payload declarations and retry policy.
class registry final {
 public:
  /// Register or replace the definition for `definition.type`.
  void add(job_definition definition);

  const job_definition* find(std::string_view type) const;

  /// Check `payload` against the declaration for `type`.
  ///
  /// Fails `job_type_not_found` for an unknown type and
  /// `schema_validation_failed` listing every missing required field and
  /// every declared field holding the wrong kind of value. Undeclared fields
  /// are accepted.
  schema::operation_result<job_policy> validate(
      std::string_view type,
      const schema::job_payload_t& payload) const;

  std::vector<std::string> types() const;

 private:
  std::map<std::string, job_definition, std::less<>> definitions_;
};

/// `payout.execute` and `escrow.refund` with their production policies.
registry make_default_registry();

}  // namespace disburse::jobs
