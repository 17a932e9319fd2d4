#include <disburse/common/critical.hpp>
#include <disburse/storage/rocksdb/storage.hpp>
#include <string>

namespace disburse::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    common::critical("Failed to open RocksDB");
  }
  spdlog::info("Opened RocksDB state at {}", path);
  store.database.reset(database);
  return store;
}

std::optional<schema::bytes_t> storage<rocksdb_storage_tag>::get_raw(
    const schema::bytes_view_t& key) const {
  if (!database) {
    common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    common::critical("Failed to get value from RocksDB");
  }
  return schema::bytes_t(std::begin(value), std::end(value));
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const schema::bytes_view_t& prefix) const {
  if (!database) {
    common::critical("RocksDB database is not initialized");
  }
  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  return entries;
}

void storage<rocksdb_storage_tag>::write(
    ROCKSDB_NAMESPACE::WriteBatch& batch) const {
  if (!database) {
    common::critical("RocksDB database is not initialized");
  }
  auto status = database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!status.ok()) {
    spdlog::error("Failed to commit RocksDB batch: {}", status.ToString());
    common::critical("Failed to commit RocksDB batch");
  }
}

}  // namespace disburse::storage
