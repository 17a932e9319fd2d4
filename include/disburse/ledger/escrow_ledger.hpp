#pragma once

#include <disburse/ports/id_generator.hpp>
#include <disburse/ports/time_source.hpp>
#include <disburse/schema/escrow.hpp>
#include <disburse/schema/milestone.hpp>
#include <disburse/schema/operation_result.hpp>
#include <disburse/schema/payment_transaction.hpp>
#include <disburse/storage/state_store.hpp>

#include <initializer_list>
#include <optional>
#include <string_view>

namespace disburse::ledger {

inline constexpr auto kCodespace = std::string_view{"disburse.escrow"};

/// Escrow life cycle rules.
///
///   locked -> held       dispute
///   held -> locked       dispute resolved without release
///   locked -> released   approval, final
///   locked|held -> refunded  rejection, final
///
/// The ledger plans transitions and hands back the next record; callers put
/// it in the same change set as the milestone write so both land together.
class escrow_ledger final {
 public:
  escrow_ledger(const storage::state_store& store,
                ports::time_source_t clock,
                ports::id_generator_t ids);

  /// New `locked` escrow holding the funds of a succeeded transaction.
  schema::escrow_t open(const schema::milestone_t& milestone,
                        const schema::payment_transaction_t& transaction) const;

  schema::operation_result<schema::escrow_t> plan_hold(
      const schema::escrow_t& escrow) const;
  schema::operation_result<schema::escrow_t> plan_unhold(
      const schema::escrow_t& escrow) const;
  schema::operation_result<schema::escrow_t> plan_release(
      const schema::escrow_t& escrow) const;
  schema::operation_result<schema::escrow_t> plan_refund(
      const schema::escrow_t& escrow) const;

  std::optional<schema::escrow_t> active_for(
      std::string_view milestone_id) const;
  std::optional<schema::escrow_t> find(std::string_view escrow_id) const;

 private:
  schema::operation_result<schema::escrow_t> plan(
      const schema::escrow_t& escrow,
      std::initializer_list<schema::escrow_status_t> from,
      schema::escrow_status_t to) const;

  const storage::state_store& store_;
  ports::time_source_t clock_;
  ports::id_generator_t ids_;
};

}  // namespace disburse::ledger
