#include <fmt/format.h>
#include <fmt/ranges.h>
#include <disburse/jobs/registry.hpp>

using namespace disburse::schema;

namespace disburse::jobs {

void registry::add(job_definition definition) {
  auto type = definition.type;
  definitions_.insert_or_assign(std::move(type), std::move(definition));
}

const job_definition* registry::find(std::string_view type) const {
  auto found = definitions_.find(type);
  if (found == std::end(definitions_)) {
    return nullptr;
  }
  return &found->second;
}

operation_result<job_policy> registry::validate(
    std::string_view type,
    const job_payload_t& payload) const {
  const auto* definition = find(type);
  if (definition == nullptr) {
    return make_failure<job_policy>(
        error_code::job_type_not_found, kCodespace,
        fmt::format("job type '{}' is not registered", type));
  }

  auto problems = std::vector<std::string>{};
  for (const auto& field : definition->fields) {
    auto found = payload.find(field.name);
    if (found == std::end(payload)) {
      if (field.required) {
        problems.push_back(
            fmt::format("Missing required field: {}", field.name));
      }
      continue;
    }
    if (kind_of(found->second) != field.kind) {
      problems.push_back(fmt::format(
          "Invalid type for field: {} (expected {}, got {})", field.name,
          to_string(field.kind), to_string(kind_of(found->second))));
    }
  }
  if (!problems.empty()) {
    return make_failure<job_policy>(
        error_code::schema_validation_failed, kCodespace,
        fmt::format("{}", fmt::join(problems, "; ")));
  }
  return make_success(definition->policy, kCodespace);
}

std::vector<std::string> registry::types() const {
  auto out = std::vector<std::string>{};
  for (const auto& [type, definition] : definitions_) {
    out.push_back(type);
  }
  return out;
}

registry make_default_registry() {
  auto out = registry{};
  out.add(job_definition{
      .type = "payout.execute",
      .fields = {field_spec{"batch_id", payload_kind_t::string, true},
                 field_spec{"escrow_id", payload_kind_t::string, true},
                 field_spec{"is_retry", payload_kind_t::boolean, false}},
      .policy = job_policy{.max_attempts = 10,
                           .timeout_seconds = 60,
                           .concurrency_limit = 5}});
  out.add(job_definition{
      .type = "escrow.refund",
      .fields = {field_spec{"escrow_id", payload_kind_t::string, true},
                 field_spec{"reason", payload_kind_t::string, false}},
      .policy = job_policy{.max_attempts = 5,
                           .timeout_seconds = 60,
                           .concurrency_limit = 2}});
  return out;
}

}  // namespace disburse::jobs
