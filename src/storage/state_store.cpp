#include <disburse/storage/state_store.hpp>

namespace disburse::storage {

const schema::entity_id_t& record_id(const record_t& record) {
  return std::visit(
      overloaded{
          [](const schema::project_t& value) -> const schema::entity_id_t& {
            return value.project_id;
          },
          [](const schema::milestone_t& value) -> const schema::entity_id_t& {
            return value.milestone_id;
          },
          [](const schema::escrow_t& value) -> const schema::entity_id_t& {
            return value.escrow_id;
          },
          [](const schema::payment_transaction_t& value)
              -> const schema::entity_id_t& { return value.transaction_id; },
          [](const schema::payout_batch_t& value)
              -> const schema::entity_id_t& { return value.batch_id; }},
      record);
}

uint64_t& record_revision(record_t& record) {
  return std::visit([](auto& value) -> uint64_t& { return value.revision; },
                    record);
}

}  // namespace disburse::storage
