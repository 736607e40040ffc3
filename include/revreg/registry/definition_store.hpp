#pragma once

#include <revreg/registry/collaborators.hpp>
#include <revreg/registry/identity_authorizer.hpp>
#include <revreg/schema/create_definition.hpp>
#include <revreg/schema/encoding/scale/encoder.hpp>
#include <revreg/schema/ledger_clock.hpp>
#include <revreg/schema/read_result.hpp>
#include <revreg/schema/registry_result.hpp>
#include <revreg/schema/revocation_registry_definition.hpp>
#include <revreg/storage/event_log.hpp>
#include <revreg/storage/rocksdb/storage.hpp>

namespace revreg::registry {

inline constexpr auto kCreateDefinitionCodespace =
    std::string_view{"revreg.create_definition"};
inline constexpr auto kResolveDefinitionCodespace =
    std::string_view{"revreg.resolve_definition"};

/// Keyed storage of revocation registry definitions. Definitions are
/// immutable once created; a definition exists iff its record has a non-zero
/// created_at.
class definition_store final {
 public:
  definition_store(revreg::schema::encoding::scale_encoder_t& encoder,
                   revreg::storage::rocksdb_storage_t& storage,
                   revreg::storage::event_log& events,
                   const identity_authorizer& authorizer,
                   credential_definition_resolver_t credential_definitions);

  /// Store a new definition, initialize its empty chain tail, and emit a
  /// DefinitionCreated notification, all in one batch.
  ///
  /// Checks run in order: duplicate id, credential definition existence,
  /// authorization.
  revreg::schema::registry_result_t create(
      const revreg::schema::create_definition_t& operation,
      const revreg::schema::address_t& identity,
      const revreg::schema::address_t& acting_party,
      const revreg::schema::ledger_clock_t& clock);

  revreg::schema::read_result<revreg::schema::revocation_registry_definition_t>
  resolve(const revreg::schema::hash32_t& id) const;

  /// Current chain tail; zero when no entry has been appended yet.
  revreg::schema::read_result<revreg::schema::position_t> last_entry_position(
      const revreg::schema::hash32_t& id) const;

 private:
  bool exists(const revreg::schema::hash32_t& id) const;

  revreg::schema::encoding::scale_encoder_t& encoder_;
  revreg::storage::rocksdb_storage_t& storage_;
  revreg::storage::event_log& events_;
  const identity_authorizer& authorizer_;
  credential_definition_resolver_t credential_definitions_;
};

}  // namespace revreg::registry
