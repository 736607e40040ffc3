#pragma once

#include <revreg/registry/collaborators.hpp>
#include <revreg/registry/definition_store.hpp>
#include <revreg/registry/endorsement.hpp>
#include <revreg/registry/entry_chain.hpp>
#include <revreg/registry/history_reconstructor.hpp>
#include <revreg/registry/identity_authorizer.hpp>
#include <revreg/registry/status_list_resolver.hpp>
#include <revreg/schema/create_definition.hpp>
#include <revreg/schema/create_entry.hpp>
#include <revreg/schema/definition_created_event.hpp>
#include <revreg/schema/encoding/scale/encoder.hpp>
#include <revreg/schema/entry_created_event.hpp>
#include <revreg/schema/ledger_clock.hpp>
#include <revreg/schema/read_result.hpp>
#include <revreg/schema/registry_result.hpp>
#include <revreg/schema/revocation_registry_definition.hpp>
#include <revreg/schema/revocation_status_list.hpp>
#include <revreg/schema/write_request.hpp>
#include <revreg/storage/event_log.hpp>
#include <revreg/storage/rocksdb/storage.hpp>
#include <mutex>
#include <vector>

namespace revreg::registry {

inline constexpr auto kBeginBlockCodespace =
    std::string_view{"revreg.begin_block"};

/// External registries the write path consults.
struct registry_collaborators final {
  role_resolver_t roles;
  did_controller_resolver_t did_controllers;
  credential_definition_resolver_t credential_definitions;
  /// Defaults to secp256k1 address recovery when left empty.
  address_recoverer_t recoverer;
};

/// Revocation ledger engine.
///
/// Writes are applied in submission order under a single lock and stamped
/// with the current block. Reads never take that lock; they only see state
/// committed by completed writes.
class revocation_registry final {
 public:
  revocation_registry(revreg::schema::encoding::scale_encoder_t& encoder,
                      revreg::storage::rocksdb_storage_t& storage,
                      revreg::schema::address_t address,
                      registry_collaborators collaborators);

  /// Start a new block. Heights must strictly increase and timestamps must be
  /// non-zero.
  revreg::schema::registry_result_t begin_block(
      revreg::schema::position_t height,
      revreg::schema::timestamp_seconds_t timestamp);

  revreg::schema::ledger_clock_t clock() const;

  const revreg::schema::address_t& address() const;

  revreg::schema::registry_result_t create_definition(
      const revreg::schema::create_definition_t& operation,
      const revreg::schema::direct_request& request);

  revreg::schema::registry_result_t create_definition_delegated(
      const revreg::schema::create_definition_t& operation,
      const revreg::schema::delegated_request& request);

  revreg::schema::registry_result_t create_entry(
      const revreg::schema::create_entry_t& operation,
      const revreg::schema::direct_request& request);

  revreg::schema::registry_result_t create_entry_delegated(
      const revreg::schema::create_entry_t& operation,
      const revreg::schema::delegated_request& request);

  revreg::schema::read_result<revreg::schema::revocation_registry_definition_t>
  resolve_definition(const revreg::schema::hash32_t& id) const;

  revreg::schema::read_result<revreg::schema::position_t> last_entry_position(
      const revreg::schema::hash32_t& id) const;

  /// Entry notifications for `id`, oldest first.
  revreg::schema::read_result<std::vector<revreg::schema::entry_created_event_t>>
  reconstruct_history(const revreg::schema::hash32_t& id) const;

  revreg::schema::read_result<revreg::schema::revocation_status_list_t>
  resolve_status_list_at(const revreg::schema::hash32_t& id,
                         revreg::schema::timestamp_seconds_t timestamp) const;

  std::vector<revreg::schema::definition_created_event_t> definitions_created()
      const;

 private:
  revreg::schema::registry_result_t submit_definition(
      const revreg::schema::create_definition_t& operation,
      const revreg::schema::write_request_t& request);

  revreg::schema::registry_result_t submit_entry(
      const revreg::schema::create_entry_t& operation,
      const revreg::schema::write_request_t& request);

  /// Fails with no_active_block before the first block.
  std::optional<revreg::schema::registry_result_t> require_block(
      std::string_view codespace) const;

  revreg::storage::rocksdb_storage_t& storage_;
  revreg::schema::address_t address_;
  mutable std::mutex write_mutex_;
  revreg::schema::ledger_clock_t clock_;
  revreg::storage::event_log events_;
  identity_authorizer authorizer_;
  endorsement_verifier verifier_;
  definition_store definitions_;
  entry_chain entries_;
  history_reconstructor history_;
  status_list_resolver status_lists_;
};

}  // namespace revreg::registry
