#pragma once

#include <revreg/registry/collaborators.hpp>
#include <revreg/schema/credential_definition_record.hpp>
#include <revreg/schema/encoding/scale/encoder.hpp>
#include <revreg/schema/role_id.hpp>
#include <revreg/storage/rocksdb/storage.hpp>
#include <optional>
#include <string_view>

namespace revreg::registry {

/// RocksDB-backed stand-in for the external role, DID and credential
/// definition registries.
///
/// A `did:ethr` issuer is controlled by the address it embeds unless an
/// explicit controller has been recorded for it.
class local_directory final {
 public:
  local_directory(revreg::schema::encoding::scale_encoder_t& encoder,
                  revreg::storage::rocksdb_storage_t& storage);

  void grant_role(const revreg::schema::address_t& party,
                  revreg::schema::role_id_t role);
  std::optional<revreg::schema::role_id_t> role_of(
      const revreg::schema::address_t& party) const;

  void set_did_controller(std::string_view did,
                          const revreg::schema::address_t& controller);
  bool is_controlled_by(std::string_view did,
                        const revreg::schema::address_t& identity) const;

  void register_credential_definition(
      const revreg::schema::credential_definition_record_t& record);
  std::optional<revreg::schema::credential_definition_record_t>
  resolve_credential_definition(const revreg::schema::hash32_t& id) const;

  role_resolver_t make_role_resolver() const;
  did_controller_resolver_t make_did_controller_resolver() const;
  credential_definition_resolver_t make_credential_definition_resolver() const;

 private:
  revreg::schema::encoding::scale_encoder_t& encoder_;
  revreg::storage::rocksdb_storage_t& storage_;
};

}  // namespace revreg::registry
