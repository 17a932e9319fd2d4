#pragma once

#include <disburse/storage/state_store.hpp>

#include <mutex>
#include <string>
#include <unordered_map>

namespace disburse::storage {

/// Process local state store guarded by one mutex.
///
/// Change sets are validated and committed under the same lock, which makes
/// every `apply` linearizable.
class memory_state_store final : public state_store {
 public:
  std::optional<schema::project_t> find_project(
      std::string_view project_id) const override;
  std::optional<schema::milestone_t> find_milestone(
      std::string_view milestone_id) const override;
  std::optional<schema::escrow_t> find_escrow(
      std::string_view escrow_id) const override;
  std::optional<schema::escrow_t> find_active_escrow(
      std::string_view milestone_id) const override;
  std::optional<schema::payment_transaction_t> find_transaction(
      std::string_view transaction_id) const override;
  std::optional<schema::payout_batch_t> find_batch(
      std::string_view batch_id) const override;
  std::optional<schema::payout_batch_t> find_batch_by_escrow(
      std::string_view escrow_id) const override;
  std::optional<schema::payout_batch_t> find_batch_by_transfer(
      std::string_view provider_transfer_id) const override;
  std::vector<schema::milestone_t> list_milestones(
      std::string_view project_id) const override;

  write_status_t apply(change_set& changes) override;

 private:
  template <typename T>
  using table_t = std::unordered_map<schema::entity_id_t, T>;

  template <typename T>
  table_t<T>& table();

  template <typename T>
  static std::optional<T> find_in(const table_t<T>& entries,
                                  std::string_view id);

  std::optional<schema::escrow_t> active_escrow_locked(
      std::string_view milestone_id) const;

  mutable std::mutex mutex_;
  table_t<schema::project_t> projects_;
  table_t<schema::milestone_t> milestones_;
  table_t<schema::escrow_t> escrows_;
  table_t<schema::payment_transaction_t> transactions_;
  table_t<schema::payout_batch_t> batches_;
  std::unordered_map<schema::entity_id_t, schema::entity_id_t>
      batch_by_escrow_;
};

}  // namespace disburse::storage
