#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <disburse/common/critical.hpp>
#include <disburse/schema/primitives.hpp>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace disburse::storage {

using key_value_entry_t = std::pair<schema::bytes_t, schema::bytes_t>;

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(const schema::bytes_view_t& bytes) {
  return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

inline schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <typename Library>
struct storage;

/// Thin typed layer over one RocksDB instance. Any RocksDB error other than
/// a missing key is fatal.
template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const schema::bytes_view_t& key) const;

  std::optional<schema::bytes_t> get_raw(const schema::bytes_view_t& key) const;

  /// Encode `value` into `batch` at key; nothing is written until `write`.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           ROCKSDB_NAMESPACE::WriteBatch& batch,
           const schema::bytes_view_t& key,
           const T& value) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const schema::bytes_view_t& prefix) const;

  /// Commit `batch` atomically.
  void write(ROCKSDB_NAMESPACE::WriteBatch& batch) const;
};

/// Open (creating when missing) a RocksDB database at `path`.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const schema::bytes_view_t& key) const {
  auto raw = get_raw(key);
  if (!raw) {
    return std::nullopt;
  }
  return encoder.template decode<T>(schema::bytes_view_t{*raw});
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       ROCKSDB_NAMESPACE::WriteBatch& batch,
                                       const schema::bytes_view_t& key,
                                       const T& value) const {
  auto encoded = encoder.encode(value);
  auto status = batch.Put(detail::to_slice(key),
                          detail::to_slice(schema::bytes_view_t{encoded}));
  if (!status.ok()) {
    spdlog::error("Failed to stage RocksDB write: {}", status.ToString());
    common::critical("Failed to stage RocksDB write");
  }
}

}  // namespace disburse::storage
