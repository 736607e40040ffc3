#pragma once
#include <revreg/schema/ledger_clock.hpp>
#include <revreg/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace revreg::storage {

using key_value_entry_t =
    std::pair<revreg::schema::bytes_t, revreg::schema::bytes_t>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const revreg::schema::bytes_view_t& key);

  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const revreg::schema::bytes_view_t& key,
           const T& value);

  /// Atomically persist pre-encoded entries.
  void write_batch(const std::vector<key_value_entry_t>& entries) const;

  /// Load the current ledger block (height + timestamp).
  std::optional<revreg::schema::ledger_clock_t> load_ledger_clock() const;

  /// Persist the current ledger block (height + timestamp).
  void save_ledger_clock(const revreg::schema::ledger_clock_t& clock) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const revreg::schema::bytes_view_t& prefix) const;

  /// Return key-value pairs in [first, last], or std::nullopt when the scan
  /// could not be completed.
  std::optional<std::vector<key_value_entry_t>> try_list_range(
      const revreg::schema::bytes_view_t& first,
      const revreg::schema::bytes_view_t& last) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace revreg::storage
