#pragma once

#include <disburse/schema/primitives.hpp>
#include <string_view>

namespace disburse::ports {

/// Outbound user notifications (email, push). Delivery is best effort and
/// never influences settlement state.
class notification_port {
 public:
  virtual ~notification_port() = default;

  virtual void notify(const schema::entity_id_t& user_id,
                      std::string_view kind,
                      std::string_view message) = 0;
};

/// Writes notifications to the log instead of delivering them.
class logging_notification_port final : public notification_port {
 public:
  void notify(const schema::entity_id_t& user_id,
              std::string_view kind,
              std::string_view message) override;
};

}  // namespace disburse::ports
