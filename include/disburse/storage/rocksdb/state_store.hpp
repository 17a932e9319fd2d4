#pragma once

#include <disburse/schema/encoding/scale/encoder.hpp>
#include <disburse/storage/rocksdb/storage.hpp>
#include <disburse/storage/state_store.hpp>

#include <mutex>
#include <string_view>

namespace disburse::storage {

/// Durable state store: SCALE encoded records in RocksDB under BLAKE3 hashed
/// keys, plus secondary indexes for the lookups the engine needs.
///
/// Change sets are validated under the store mutex and committed with one
/// WriteBatch, so records and their index entries land together.
class rocksdb_state_store final : public state_store {
 public:
  explicit rocksdb_state_store(const std::string_view& path);

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
  using encoder_t = schema::encoding::encoder<
      schema::encoding::scale_encoder_tag>;

  template <typename T>
  std::optional<T> load(std::string_view id) const;
  std::optional<schema::entity_id_t> load_index(
      const schema::bytes_t& key) const;
  std::optional<schema::escrow_t> active_escrow_unlocked(
      std::string_view milestone_id) const;
  void stage(ROCKSDB_NAMESPACE::WriteBatch& batch, const change& entry);

  mutable std::mutex mutex_;
  mutable encoder_t encoder_;
  storage<rocksdb_storage_tag> storage_;
};

}  // namespace disburse::storage
