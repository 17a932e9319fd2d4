#include <spdlog/spdlog.h>
#include <disburse/schema/key/builder.hpp>
#include <disburse/storage/rocksdb/state_store.hpp>
#include <algorithm>
#include <set>
#include <string>
#include <type_traits>

using namespace disburse::schema;

namespace disburse::storage {

namespace {

template <typename T>
constexpr std::string_view record_prefix() {
  if constexpr (std::is_same_v<T, project_t>) {
    return "DSB|REC|PROJECT|";
  } else if constexpr (std::is_same_v<T, milestone_t>) {
    return "DSB|REC|MILESTONE|";
  } else if constexpr (std::is_same_v<T, escrow_t>) {
    return "DSB|REC|ESCROW|";
  } else if constexpr (std::is_same_v<T, payment_transaction_t>) {
    return "DSB|REC|TRANSACTION|";
  } else {
    static_assert(std::is_same_v<T, payout_batch_t>);
    return "DSB|REC|BATCH|";
  }
}

constexpr auto kActiveEscrowPrefix = std::string_view{"DSB|IDX|ACTIVE_ESCROW|"};
constexpr auto kBatchByEscrowPrefix = std::string_view{"DSB|IDX|BATCH_ESCROW|"};
constexpr auto kBatchByTransferPrefix =
    std::string_view{"DSB|IDX|BATCH_TRANSFER|"};
constexpr auto kProjectMilestonePrefix =
    std::string_view{"DSB|IDX|PROJECT_MILESTONE|"};

template <typename T>
bytes_t record_key(std::string_view id) {
  return key::builder{}.write(record_prefix<T>()).hash(id).data;
}

bytes_t index_key(std::string_view prefix, std::string_view id) {
  return key::builder{}.write(prefix).hash(id).data;
}

bytes_t project_milestone_key(std::string_view project_id,
                              std::string_view milestone_id) {
  return key::builder{}
      .write(kProjectMilestonePrefix)
      .hash(project_id)
      .hash(milestone_id)
      .data;
}

void stage_raw(ROCKSDB_NAMESPACE::WriteBatch& batch,
               const bytes_t& key,
               std::string_view value) {
  auto status = batch.Put(detail::to_slice(bytes_view_t{key}),
                          ROCKSDB_NAMESPACE::Slice{value.data(), value.size()});
  if (!status.ok()) {
    common::critical("failed to stage RocksDB index entry");
  }
}

}  // namespace

rocksdb_state_store::rocksdb_state_store(const std::string_view& path)
    : storage_{make_storage<rocksdb_storage_tag>(path)} {}

template <typename T>
std::optional<T> rocksdb_state_store::load(std::string_view id) const {
  auto key = record_key<T>(id);
  return storage_.get<T>(encoder_, bytes_view_t{key});
}

std::optional<entity_id_t> rocksdb_state_store::load_index(
    const bytes_t& key) const {
  auto raw = storage_.get_raw(bytes_view_t{key});
  if (!raw) {
    return std::nullopt;
  }
  return entity_id_t(std::begin(*raw), std::end(*raw));
}

std::optional<project_t> rocksdb_state_store::find_project(
    std::string_view project_id) const {
  auto lock = std::scoped_lock{mutex_};
  return load<project_t>(project_id);
}

std::optional<milestone_t> rocksdb_state_store::find_milestone(
    std::string_view milestone_id) const {
  auto lock = std::scoped_lock{mutex_};
  return load<milestone_t>(milestone_id);
}

std::optional<escrow_t> rocksdb_state_store::find_escrow(
    std::string_view escrow_id) const {
  auto lock = std::scoped_lock{mutex_};
  return load<escrow_t>(escrow_id);
}

std::optional<escrow_t> rocksdb_state_store::find_active_escrow(
    std::string_view milestone_id) const {
  auto lock = std::scoped_lock{mutex_};
  return active_escrow_unlocked(milestone_id);
}

std::optional<escrow_t> rocksdb_state_store::active_escrow_unlocked(
    std::string_view milestone_id) const {
  auto escrow_id = load_index(index_key(kActiveEscrowPrefix, milestone_id));
  if (!escrow_id) {
    return std::nullopt;
  }
  auto escrow = load<escrow_t>(*escrow_id);
  if (!escrow || !is_active(escrow->status)) {
    return std::nullopt;
  }
  return escrow;
}

std::optional<payment_transaction_t> rocksdb_state_store::find_transaction(
    std::string_view transaction_id) const {
  auto lock = std::scoped_lock{mutex_};
  return load<payment_transaction_t>(transaction_id);
}

std::optional<payout_batch_t> rocksdb_state_store::find_batch(
    std::string_view batch_id) const {
  auto lock = std::scoped_lock{mutex_};
  return load<payout_batch_t>(batch_id);
}

std::optional<payout_batch_t> rocksdb_state_store::find_batch_by_escrow(
    std::string_view escrow_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto batch_id = load_index(index_key(kBatchByEscrowPrefix, escrow_id));
  if (!batch_id) {
    return std::nullopt;
  }
  return load<payout_batch_t>(*batch_id);
}

std::optional<payout_batch_t> rocksdb_state_store::find_batch_by_transfer(
    std::string_view provider_transfer_id) const {
  auto lock = std::scoped_lock{mutex_};
  if (provider_transfer_id.empty()) {
    return std::nullopt;
  }
  auto batch_id =
      load_index(index_key(kBatchByTransferPrefix, provider_transfer_id));
  if (!batch_id) {
    return std::nullopt;
  }
  return load<payout_batch_t>(*batch_id);
}

std::vector<milestone_t> rocksdb_state_store::list_milestones(
    std::string_view project_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto prefix = key::builder{}.write(kProjectMilestonePrefix).hash(project_id).data;
  auto out = std::vector<milestone_t>{};
  for (const auto& [key, value] : storage_.list_by_prefix(bytes_view_t{prefix})) {
    auto milestone_id = entity_id_t(std::begin(value), std::end(value));
    if (auto milestone = load<milestone_t>(milestone_id)) {
      out.push_back(std::move(*milestone));
    }
  }
  std::ranges::sort(out, {}, &milestone_t::created_at);
  return out;
}

void rocksdb_state_store::stage(ROCKSDB_NAMESPACE::WriteBatch& batch,
                                const change& entry) {
  std::visit(
      [&]<typename T>(const T& value) {
        auto key = record_key<T>(record_id(entry.record));
        storage_.put(encoder_, batch, bytes_view_t{key}, value);

        if constexpr (std::is_same_v<T, milestone_t>) {
          if (entry.mode == write_mode_t::insert) {
            stage_raw(batch,
                      project_milestone_key(value.project_id,
                                            value.milestone_id),
                      value.milestone_id);
          }
        }
        if constexpr (std::is_same_v<T, escrow_t>) {
          auto index = index_key(kActiveEscrowPrefix, value.milestone_id);
          if (is_active(value.status)) {
            stage_raw(batch, index, value.escrow_id);
          } else if (load_index(index) == value.escrow_id) {
            auto status = batch.Delete(detail::to_slice(bytes_view_t{index}));
            if (!status.ok()) {
              common::critical("failed to stage RocksDB index delete");
            }
          }
        }
        if constexpr (std::is_same_v<T, payout_batch_t>) {
          stage_raw(batch, index_key(kBatchByEscrowPrefix, value.escrow_id),
                    value.batch_id);
          for (const auto& item : value.items) {
            if (!item.provider_transfer_id.empty()) {
              stage_raw(batch,
                        index_key(kBatchByTransferPrefix,
                                  item.provider_transfer_id),
                        value.batch_id);
            }
          }
        }
      },
      entry.record);
}

write_status_t rocksdb_state_store::apply(change_set& changes) {
  auto lock = std::scoped_lock{mutex_};

  auto claimed_milestones = std::set<entity_id_t>{};
  auto claimed_escrows = std::set<entity_id_t>{};
  auto touched = std::set<entity_id_t>{};

  for (const auto& entry : changes.changes) {
    auto status = std::visit(
        [&]<typename T>(const T& value) {
          const auto& id = record_id(entry.record);
          if (!touched.insert(id).second) {
            return write_status_t::already_exists;
          }
          auto stored = load<T>(id);
          if (entry.mode == write_mode_t::insert) {
            if (stored) {
              return write_status_t::already_exists;
            }
          } else {
            if (!stored) {
              return write_status_t::not_found;
            }
            if (stored->revision != value.revision) {
              return write_status_t::revision_conflict;
            }
          }

          if constexpr (std::is_same_v<T, escrow_t>) {
            if (is_active(value.status)) {
              auto active = active_escrow_unlocked(value.milestone_id);
              if ((active && active->escrow_id != value.escrow_id) ||
                  !claimed_milestones.insert(value.milestone_id).second) {
                return write_status_t::escrow_already_active;
              }
            }
          }
          if constexpr (std::is_same_v<T, payout_batch_t>) {
            if (entry.mode == write_mode_t::insert &&
                (load_index(index_key(kBatchByEscrowPrefix, value.escrow_id)) ||
                 !claimed_escrows.insert(value.escrow_id).second)) {
              return write_status_t::batch_already_exists;
            }
          }
          return write_status_t::ok;
        },
        entry.record);
    if (status != write_status_t::ok) {
      spdlog::debug("RocksDB store rejected change for '{}': {}",
                    record_id(entry.record), to_string(status));
      return status;
    }
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (auto& entry : changes.changes) {
    auto& revision = record_revision(entry.record);
    revision = entry.mode == write_mode_t::insert ? 1 : revision + 1;
    stage(batch, entry);
  }
  storage_.write(batch);
  return write_status_t::ok;
}

}  // namespace disburse::storage
