#pragma once

#include <disburse/schema/payout_status.hpp>
#include <disburse/schema/placeholder_policy.hpp>
#include <disburse/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: payout batch.
// One batch per released escrow. Items keep their own attempt counters so a
// job level retry only touches the items that are not yet paid.
namespace disburse::schema {

template <uint16_t Version>
struct payout_item;

template <>
struct payout_item<1> final {
  uint16_t version{1};
  entity_id_t recipient_id;
  percent_t percentage{};
  amount_t gross_share{};
  amount_t fee_share{};
  amount_t tax_withheld{};
  amount_t net_amount{};
  payout_status_t status{payout_status_t::scheduled};
  std::string provider_transfer_id;
  std::string failure_reason;
  uint32_t attempts{};
  // Bumped each time the provider reports the transfer failed, so the next
  // attempt goes out under a fresh idempotency key.
  uint32_t transfer_round{};
};

using payout_item_t = payout_item<1>;

template <uint16_t Version>
struct payout_batch;

template <>
struct payout_batch<1> final {
  uint16_t version{1};
  entity_id_t batch_id;
  entity_id_t escrow_id;
  entity_id_t project_id;
  std::optional<entity_id_t> milestone_id;
  currency_t currency;
  amount_t gross_amount{};
  amount_t platform_fee{};
  amount_t total_net{};
  amount_t withheld_amount{};
  placeholder_policy_t placeholder_policy{placeholder_policy_t::withhold};
  payout_status_t status{payout_status_t::scheduled};
  std::vector<payout_item_t> items;
  std::optional<entity_id_t> job_id;
  uint64_t revision{};
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t updated_at{};
};

using payout_batch_t = payout_batch<1>;

/// Batch status implied by its items: paid once every item is paid,
/// otherwise processing after the first attempt and scheduled before it.
payout_status_t derive_batch_status(const payout_batch_t& batch);

}  // namespace disburse::schema
