#pragma once

#include <disburse/schema/project.hpp>
#include <string_view>

namespace disburse::ports {

/// Delegated authorisation checks for milestone transitions.
class access_policy {
 public:
  virtual ~access_policy() = default;

  virtual bool is_member(const schema::project_t& project,
                         std::string_view actor_id) const = 0;
  virtual bool is_owner(const schema::project_t& project,
                        std::string_view actor_id) const = 0;
};

/// Answers from the project record itself; the owner is always a member.
class project_access_policy final : public access_policy {
 public:
  bool is_member(const schema::project_t& project,
                 std::string_view actor_id) const override;
  bool is_owner(const schema::project_t& project,
                std::string_view actor_id) const override;
};

}  // namespace disburse::ports
