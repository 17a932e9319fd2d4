#pragma once

#include <disburse/ports/event_publisher_port.hpp>
#include <disburse/ports/id_generator.hpp>
#include <disburse/ports/psp_gateway.hpp>
#include <disburse/ports/time_source.hpp>
#include <disburse/schema/operation_result.hpp>
#include <disburse/schema/payment_transaction.hpp>
#include <disburse/storage/state_store.hpp>

#include <string>
#include <string_view>

namespace disburse::payment {

inline constexpr auto kCodespace = std::string_view{"disburse.payment"};

struct intent_t final {
  schema::payment_transaction_t transaction;
  std::string client_secret;
  std::string checkout_url;
};

/// Opens a provider payment flow for a pending milestone and records the
/// `created` transaction whose id the provider echoes back in webhooks.
class intent_service final {
 public:
  intent_service(storage::state_store& store,
                 ports::psp_gateway& gateway,
                 ports::event_publisher_port& events,
                 ports::id_generator_t ids,
                 ports::time_source_t clock);

  /// Fails `milestone_not_found`, `invalid_argument` when the milestone
  /// belongs to another project or `provider` is not the configured gateway,
  /// `invalid_transition` unless the milestone is pending, and
  /// `gateway_request_failed` when the provider call throws.
  schema::operation_result<intent_t> create(std::string_view project_id,
                                            std::string_view milestone_id,
                                            std::string_view payer_id,
                                            std::string_view provider = {});

 private:
  storage::state_store& store_;
  ports::psp_gateway& gateway_;
  ports::event_publisher_port& events_;
  ports::id_generator_t ids_;
  ports::time_source_t clock_;
};

}  // namespace disburse::payment
