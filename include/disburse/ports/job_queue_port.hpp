#pragma once

#include <disburse/schema/job.hpp>
#include <disburse/schema/operation_result.hpp>

#include <optional>
#include <string_view>

namespace disburse::ports {

/// Accepts new asynchronous work. Implementations validate the payload
/// against the job type before accepting it.
class job_queue_port {
 public:
  virtual ~job_queue_port() = default;

  /// Returns the new job on success; fails `job_type_not_found` or
  /// `schema_validation_failed`.
  virtual schema::operation_result<schema::job_t> enqueue(
      std::string_view type,
      schema::job_payload_t payload,
      std::optional<int32_t> priority = std::nullopt) = 0;

  virtual std::optional<schema::job_t> find(std::string_view job_id) const = 0;
};

}  // namespace disburse::ports
