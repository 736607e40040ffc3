#pragma once

#include <revreg/schema/definition_created_event.hpp>
#include <revreg/schema/encoding/scale/encoder.hpp>
#include <revreg/schema/entry_created_event.hpp>
#include <revreg/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace revreg::storage {

/// Append-only notification log over RocksDB.
///
/// Entry notifications are keyed by (definition id, position, log index) so a
/// definition's notifications can be fetched by position range. Emission is
/// staged into a caller-owned batch; nothing is visible until the caller
/// commits that batch together with the state it belongs to.
class event_log final {
 public:
  event_log(revreg::schema::encoding::scale_encoder_t& encoder,
            rocksdb_storage_t& storage);

  /// Next unused log index. Log indices are global and strictly increasing.
  uint64_t next_log_index() const;

  /// Stage an entry notification and advance the log index past it.
  void stage_entry(const revreg::schema::entry_created_event_t& event,
                   std::vector<key_value_entry_t>& batch) const;

  /// Stage a definition notification and advance the log index past it.
  void stage_definition_created(
      const revreg::schema::definition_created_event_t& event,
      std::vector<key_value_entry_t>& batch) const;

  /// Entry notifications for `definition_id` with position in [from, to],
  /// ordered by (position, log index). Returns std::nullopt when the scan
  /// fails or a stored notification cannot be decoded.
  std::optional<std::vector<revreg::schema::entry_created_event_t>> query(
      const revreg::schema::hash32_t& definition_id,
      revreg::schema::position_t from,
      revreg::schema::position_t to) const;

  /// Every definition notification, oldest first.
  std::vector<revreg::schema::definition_created_event_t>
  definitions_created() const;

 private:
  revreg::schema::encoding::scale_encoder_t& encoder_;
  rocksdb_storage_t& storage_;
};

}  // namespace revreg::storage
