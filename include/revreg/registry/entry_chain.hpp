#pragma once

#include <revreg/registry/definition_store.hpp>
#include <revreg/registry/identity_authorizer.hpp>
#include <revreg/schema/create_entry.hpp>
#include <revreg/schema/encoding/scale/encoder.hpp>
#include <revreg/schema/ledger_clock.hpp>
#include <revreg/schema/registry_result.hpp>
#include <revreg/storage/event_log.hpp>
#include <revreg/storage/rocksdb/storage.hpp>

namespace revreg::registry {

inline constexpr auto kCreateEntryCodespace =
    std::string_view{"revreg.create_entry"};

/// Append-only, backward-linked entry chain per definition.
///
/// Only the tail position is persisted as state. Each appended entry is
/// emitted as a notification carrying the previous tail, and the tail then
/// moves to the new notification's position.
class entry_chain final {
 public:
  entry_chain(revreg::schema::encoding::scale_encoder_t& encoder,
              revreg::storage::rocksdb_storage_t& storage,
              revreg::storage::event_log& events,
              const definition_store& definitions,
              const identity_authorizer& authorizer);

  revreg::schema::registry_result_t append(
      const revreg::schema::create_entry_t& operation,
      const revreg::schema::address_t& identity,
      const revreg::schema::address_t& acting_party,
      const revreg::schema::ledger_clock_t& clock);

 private:
  revreg::schema::encoding::scale_encoder_t& encoder_;
  revreg::storage::rocksdb_storage_t& storage_;
  revreg::storage::event_log& events_;
  const definition_store& definitions_;
  const identity_authorizer& authorizer_;
};

}  // namespace revreg::registry
