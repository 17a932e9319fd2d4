#include <disburse/ports/access_policy.hpp>
#include <algorithm>

namespace disburse::ports {

bool project_access_policy::is_member(const schema::project_t& project,
                                      std::string_view actor_id) const {
  return is_owner(project, actor_id) ||
         std::ranges::find(project.member_ids, actor_id) !=
             std::end(project.member_ids);
}

bool project_access_policy::is_owner(const schema::project_t& project,
                                     std::string_view actor_id) const {
  return !actor_id.empty() && project.owner_id == actor_id;
}

}  // namespace disburse::ports
