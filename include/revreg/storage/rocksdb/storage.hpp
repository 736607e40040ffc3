#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <revreg/common/critical.hpp>
#include <revreg/schema/encoding/scale/encoder.hpp>
#include <revreg/schema/key/registry_keys.hpp>
#include <revreg/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <scale/scale.hpp>
#include <string_view>

namespace revreg::storage {

namespace detail {

using encoder_t = revreg::schema::encoding::scale_encoder_t;

inline revreg::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const revreg::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const revreg::schema::bytes_view_t& key);

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const revreg::schema::bytes_view_t& key,
           const T& value);

  void write_batch(const std::vector<key_value_entry_t>& entries) const;
  std::optional<revreg::schema::ledger_clock_t> load_ledger_clock() const;
  void save_ledger_clock(const revreg::schema::ledger_clock_t& clock) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const revreg::schema::bytes_view_t& prefix) const;
  std::optional<std::vector<key_value_entry_t>> try_list_range(
      const revreg::schema::bytes_view_t& first,
      const revreg::schema::bytes_view_t& last) const;
};

using rocksdb_storage_t = storage<rocksdb_storage_tag>;

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename Encoder, typename T>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const revreg::schema::bytes_view_t& key) {
  if (!database) {
    revreg::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    } else {
      spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
      revreg::common::critical("Failed to get value from RocksDB");
    }
  }
  return {encoder.template decode<T>(revreg::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename Encoder, typename T>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const revreg::schema::bytes_view_t& key,
                                       const T& value) {
  if (!database) {
    revreg::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status =
      database->Put(ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
                    detail::to_slice(encoded_value));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    revreg::common::critical("Failed to put value into RocksDB");
  }
}

inline void storage<rocksdb_storage_tag>::write_batch(
    const std::vector<key_value_entry_t>& entries) const {
  if (!database) {
    revreg::common::critical("RocksDB database is not initialized");
  }
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status =
        batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!put_status.ok()) {
      revreg::common::critical("failed writing key into batch");
    }
  }
  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit RocksDB batch: {}",
                  write_status.ToString());
    revreg::common::critical("failed to commit write batch");
  }
}

inline std::optional<revreg::schema::ledger_clock_t>
storage<rocksdb_storage_tag>::load_ledger_clock() const {
  if (!database) {
    revreg::common::critical("RocksDB database is not initialized");
  }
  auto encoder = detail::encoder_t{};
  auto key = revreg::schema::key::make_ledger_clock_key(encoder);
  auto raw = std::string{};
  auto status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{}, detail::to_slice(key), &raw);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    revreg::common::critical("failed to load ledger clock");
  }
  auto decoded = encoder.try_decode<revreg::schema::ledger_clock_t>(
      revreg::schema::bytes_view_t{reinterpret_cast<const uint8_t*>(raw.data()),
                                   raw.size()});
  if (!decoded.has_value()) {
    revreg::common::critical("failed to decode ledger clock");
  }
  return decoded;
}

inline void storage<rocksdb_storage_tag>::save_ledger_clock(
    const revreg::schema::ledger_clock_t& clock) const {
  if (!database) {
    revreg::common::critical("RocksDB database is not initialized");
  }
  auto encoder = detail::encoder_t{};
  auto key = revreg::schema::key::make_ledger_clock_key(encoder);
  auto encoded = encoder.encode(clock);
  auto status = database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                              detail::to_slice(key), detail::to_slice(encoded));
  if (!status.ok()) {
    revreg::common::critical("failed to persist ledger clock");
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const revreg::schema::bytes_view_t& prefix) const {
  if (!database) {
    revreg::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
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
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB prefix scan failed: {}",
                  iterator->status().ToString());
    revreg::common::critical("RocksDB prefix scan failed");
  }
  return entries;
}

inline std::optional<std::vector<key_value_entry_t>>
storage<rocksdb_storage_tag>::try_list_range(
    const revreg::schema::bytes_view_t& first,
    const revreg::schema::bytes_view_t& last) const {
  if (!database) {
    revreg::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto last_slice = detail::to_slice(last);

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(detail::to_slice(first));
  while (iterator->Valid()) {
    if (iterator->key().compare(last_slice) > 0) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::warn("RocksDB range scan failed: {}",
                 iterator->status().ToString());
    return std::nullopt;
  }
  return entries;
}

}  // namespace revreg::storage
