#include <fmt/format.h>
#include <disburse/ledger/escrow_ledger.hpp>
#include <algorithm>

using namespace disburse::schema;

namespace disburse::ledger {

escrow_ledger::escrow_ledger(const storage::state_store& store,
                             ports::time_source_t clock,
                             ports::id_generator_t ids)
    : store_{store}, clock_{std::move(clock)}, ids_{std::move(ids)} {}

escrow_t escrow_ledger::open(const milestone_t& milestone,
                             const payment_transaction_t& transaction) const {
  auto escrow = escrow_t{};
  escrow.escrow_id = ids_("esc");
  escrow.project_id = milestone.project_id;
  escrow.milestone_id = milestone.milestone_id;
  escrow.payer_id = transaction.payer_id;
  escrow.transaction_id = transaction.transaction_id;
  escrow.amount = transaction.amount;
  escrow.currency = transaction.currency;
  escrow.provider = transaction.provider;
  escrow.provider_reference = transaction.provider_payment_id.empty()
                                  ? transaction.provider_intent_id
                                  : transaction.provider_payment_id;
  escrow.status = escrow_status_t::locked;
  escrow.locked_at = clock_();
  return escrow;
}

operation_result<escrow_t> escrow_ledger::plan(
    const escrow_t& escrow,
    std::initializer_list<escrow_status_t> from,
    const escrow_status_t to) const {
  if (std::ranges::find(from, escrow.status) == std::end(from)) {
    return make_failure<escrow_t>(
        error_code::invalid_transition, kCodespace,
        fmt::format("escrow {} cannot move from {} to {}", escrow.escrow_id,
                    to_string(escrow.status), to_string(to)));
  }
  auto next = escrow;
  next.status = to;
  if (to == escrow_status_t::released) {
    next.released_at = clock_();
  } else if (to == escrow_status_t::refunded) {
    next.refunded_at = clock_();
  }
  return make_success(std::move(next), kCodespace);
}

operation_result<escrow_t> escrow_ledger::plan_hold(
    const escrow_t& escrow) const {
  return plan(escrow, {escrow_status_t::locked}, escrow_status_t::held);
}

operation_result<escrow_t> escrow_ledger::plan_unhold(
    const escrow_t& escrow) const {
  return plan(escrow, {escrow_status_t::held}, escrow_status_t::locked);
}

operation_result<escrow_t> escrow_ledger::plan_release(
    const escrow_t& escrow) const {
  return plan(escrow, {escrow_status_t::locked}, escrow_status_t::released);
}

operation_result<escrow_t> escrow_ledger::plan_refund(
    const escrow_t& escrow) const {
  return plan(escrow, {escrow_status_t::locked, escrow_status_t::held},
              escrow_status_t::refunded);
}

std::optional<escrow_t> escrow_ledger::active_for(
    std::string_view milestone_id) const {
  return store_.find_active_escrow(milestone_id);
}

std::optional<escrow_t> escrow_ledger::find(std::string_view escrow_id) const {
  return store_.find_escrow(escrow_id);
}

}  // namespace disburse::ledger
