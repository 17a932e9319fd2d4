#pragma once

#include <disburse/schema/escrow_status.hpp>
#include <disburse/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>

// Schema type: escrow.
// Funds captured for one milestone. `provider_reference` is the PSP payment
// the release and refund calls are made against.
namespace disburse::schema {

template <uint16_t Version>
struct escrow;

template <>
struct escrow<1> final {
  uint16_t version{1};
  entity_id_t escrow_id;
  entity_id_t project_id;
  entity_id_t milestone_id;
  entity_id_t payer_id;
  entity_id_t transaction_id;
  amount_t amount{};
  currency_t currency;
  std::string provider;
  std::string provider_reference;
  escrow_status_t status{escrow_status_t::locked};
  uint64_t revision{};
  timestamp_milliseconds_t locked_at{};
  std::optional<timestamp_milliseconds_t> released_at;
  std::optional<timestamp_milliseconds_t> refunded_at;
};

using escrow_t = escrow<1>;

}  // namespace disburse::schema
