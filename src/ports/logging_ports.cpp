#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <disburse/ports/event_publisher_port.hpp>
#include <disburse/ports/notification_port.hpp>

namespace disburse::ports {

void logging_notification_port::notify(const schema::entity_id_t& user_id,
                                       std::string_view kind,
                                       std::string_view message) {
  spdlog::info("notify user={} kind={} message='{}'", user_id, kind, message);
}

void logging_event_publisher::publish(std::string_view name,
                                      const event_attributes_t& attributes) {
  spdlog::info("event {} {}", name, fmt::join(attributes, " "));
}

}  // namespace disburse::ports
