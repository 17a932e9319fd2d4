#pragma once

#include <disburse/schema/primitives.hpp>
#include <disburse/schema/transaction_status.hpp>

#include <cstdint>
#include <string>

// Schema type: payment transaction.
// Internal record of a payer's payment intent. `transaction_id` is the
// correlation id handed to the PSP and echoed back in webhook metadata.
namespace disburse::schema {

template <uint16_t Version>
struct payment_transaction;

template <>
struct payment_transaction<1> final {
  uint16_t version{1};
  entity_id_t transaction_id;
  entity_id_t project_id;
  entity_id_t milestone_id;
  entity_id_t payer_id;
  std::string provider;
  std::string provider_intent_id;
  std::string provider_payment_id;
  amount_t amount{};
  currency_t currency;
  transaction_status_t status{transaction_status_t::created};
  std::string failure_reason;
  uint64_t revision{};
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t updated_at{};
};

using payment_transaction_t = payment_transaction<1>;

}  // namespace disburse::schema
