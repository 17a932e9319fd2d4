#pragma once

#include <disburse/schema/enum_string.hpp>
#include <disburse/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace disburse::ports {

enum class psp_status_t : uint8_t { pending = 0, succeeded = 1, failed = 2 };

inline constexpr auto kPspStatusMappings = std::array{
    std::pair<std::string_view, psp_status_t>{"pending", psp_status_t::pending},
    std::pair<std::string_view, psp_status_t>{"succeeded",
                                              psp_status_t::succeeded},
    std::pair<std::string_view, psp_status_t>{"failed", psp_status_t::failed}};

inline constexpr std::string_view to_string(const psp_status_t value) {
  return schema::to_string(value, kPspStatusMappings).value_or("unknown");
}

struct intent_request final {
  schema::amount_t amount{};
  schema::currency_t currency;
  schema::entity_id_t internal_intent_id;
  std::string description;
};

struct intent_response final {
  std::string provider_intent_id;
  std::string client_secret;
  std::string checkout_url;
};

struct transfer_request final {
  std::string provider_payment_id;
  schema::entity_id_t recipient_id;
  schema::amount_t amount{};
  schema::currency_t currency;
  std::string idempotency_key;
};

struct transfer_response final {
  std::string provider_transfer_id;
  psp_status_t status{psp_status_t::pending};
  std::string failure_reason;
};

struct refund_request final {
  std::string provider_payment_id;
  schema::amount_t amount{};
  std::string reason;
  std::string idempotency_key;
};

struct refund_response final {
  std::string provider_refund_id;
  psp_status_t status{psp_status_t::pending};
};

/// Payment service provider capability, one implementation per provider.
///
/// Calls may throw std::exception on transport failures; final
/// confirmation of any money movement arrives only through webhooks.
class psp_gateway {
 public:
  virtual ~psp_gateway() = default;

  virtual std::string_view provider() const = 0;

  /// Open a payment flow (payment intent, order, checkout session).
  virtual intent_response create_intent(const intent_request& request) = 0;

  /// Capture the escrowed payment and transfer one share to a recipient.
  /// Repeating a request with the same idempotency key must not move money
  /// twice.
  virtual transfer_response capture_and_transfer(
      const transfer_request& request) = 0;

  virtual refund_response refund(const refund_request& request) = 0;
};

}  // namespace disburse::ports
