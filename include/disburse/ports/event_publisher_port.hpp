#pragma once

#include <map>
#include <string>
#include <string_view>

namespace disburse::ports {

using event_attributes_t = std::map<std::string, std::string>;

/// Domain event fan-out (audit trail, search indexing, webhooks to
/// integrators).
class event_publisher_port {
 public:
  virtual ~event_publisher_port() = default;

  virtual void publish(std::string_view name,
                       const event_attributes_t& attributes) = 0;
};

class logging_event_publisher final : public event_publisher_port {
 public:
  void publish(std::string_view name,
               const event_attributes_t& attributes) override;
};

}  // namespace disburse::ports
