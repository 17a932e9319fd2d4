#pragma once

#include <disburse/schema/enum_string.hpp>
#include <disburse/schema/operation_result.hpp>
#include <disburse/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace disburse::webhook {

inline constexpr auto kCodespace = std::string_view{"disburse.webhook"};

enum class event_kind_t : uint8_t {
  payment_succeeded = 0,
  payment_failed = 1,
  transfer_paid = 2,
  transfer_failed = 3,
  unrecognized = 4
};

inline constexpr auto kEventKindMappings = std::array{
    std::pair<std::string_view, event_kind_t>{"payment_succeeded",
                                              event_kind_t::payment_succeeded},
    std::pair<std::string_view, event_kind_t>{"payment_failed",
                                              event_kind_t::payment_failed},
    std::pair<std::string_view, event_kind_t>{"transfer_paid",
                                              event_kind_t::transfer_paid},
    std::pair<std::string_view, event_kind_t>{"transfer_failed",
                                              event_kind_t::transfer_failed},
    std::pair<std::string_view, event_kind_t>{"unrecognized",
                                              event_kind_t::unrecognized}};

inline constexpr std::string_view to_string(const event_kind_t value) {
  return schema::to_string(value, kEventKindMappings).value_or("unknown");
}

/// Provider event reduced to the fields settlement depends on.
struct event final {
  std::string type;
  event_kind_t kind{event_kind_t::unrecognized};
  std::string provider_object_id;
  std::optional<schema::entity_id_t> correlation_id;
  std::string failure_reason;
};

using event_t = event;

/// Map a provider event type onto the kinds settlement reacts to.
event_kind_t classify(std::string_view type);

/// Decode a provider webhook body:
///
///   {"type": "...",
///    "data": {"object": {"id": "...",
///                        "failure_message": "...",
///                        "metadata": {"internal_intent_id": "..."}}}}
///
/// `internalIntentId` is accepted for the correlation id as well. Fails
/// `malformed_webhook` when the body is not a JSON object or has no type.
schema::operation_result<event_t> decode(std::string_view raw_body);

}  // namespace disburse::webhook
