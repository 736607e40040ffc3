#pragma once

#include <revreg/registry/local_directory.hpp>
#include <revreg/registry/revocation_registry.hpp>
#include <revreg/schema/encoding/scale/encoder.hpp>
#include <revreg/schema/identifier.hpp>
#include <revreg/storage/rocksdb/storage.hpp>
#include <revreg/testing/common.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace revreg::testing {

using scale_encoder_t = revreg::schema::encoding::scale_encoder_t;

inline const auto kRegistryAddress = make_address(0x33);

/// RocksDB-backed registry with a local directory, removed on destruction.
class registry_fixture final {
 public:
  explicit registry_fixture(const std::string_view db_prefix)
      : db_path_{make_db_path(db_prefix)},
        encoder_{},
        storage_{revreg::storage::make_storage<
            revreg::storage::rocksdb_storage_tag>(db_path_)},
        directory_{encoder_, storage_},
        registry_{encoder_, storage_, kRegistryAddress,
                  revreg::registry::registry_collaborators{
                      .roles = directory_.make_role_resolver(),
                      .did_controllers =
                          directory_.make_did_controller_resolver(),
                      .credential_definitions =
                          directory_.make_credential_definition_resolver(),
                      .recoverer = {}}} {}

  registry_fixture(const registry_fixture&) = delete;
  registry_fixture& operator=(const registry_fixture&) = delete;
  registry_fixture(registry_fixture&&) = delete;
  registry_fixture& operator=(registry_fixture&&) = delete;

  ~registry_fixture() { remove_path(db_path_); }

  const std::string& db_path() const { return db_path_; }
  scale_encoder_t& encoder() { return encoder_; }
  revreg::storage::rocksdb_storage_t& storage() { return storage_; }
  revreg::registry::local_directory& directory() { return directory_; }
  revreg::registry::revocation_registry& registry() { return registry_; }

  /// Register a credential definition owned by `issuer_id` and return its id.
  revreg::schema::hash32_t register_credential_definition(
      const std::string& issuer_id,
      const std::string_view name = "default") {
    auto id = revreg::schema::make_identifier(
        revreg::schema::make_credential_definition_id(issuer_id, "schema",
                                                      name));
    directory_.register_credential_definition(
        revreg::schema::credential_definition_record_t{.id = id,
                                                       .issuer_id = issuer_id});
    return id;
  }

 private:
  std::string db_path_;
  scale_encoder_t encoder_;
  revreg::storage::rocksdb_storage_t storage_;
  revreg::registry::local_directory directory_;
  revreg::registry::revocation_registry registry_;
};

inline revreg::schema::create_definition_t make_create_definition(
    const std::string& issuer_id,
    const revreg::schema::hash32_t& credential_definition_id,
    const std::string_view tag = "tag") {
  auto operation = revreg::schema::create_definition_t{};
  operation.id = revreg::schema::make_identifier(
      revreg::schema::make_revocation_registry_definition_id(
          issuer_id, revreg::schema::to_hex(credential_definition_id), tag));
  operation.credential_definition_id = credential_definition_id;
  operation.issuer_id = issuer_id;
  operation.definition = revreg::schema::bytes_t{0x7b, 0x22, 0x7d};
  return operation;
}

inline revreg::schema::create_entry_t make_create_entry(
    const revreg::schema::hash32_t& definition_id,
    const std::string& issuer_id,
    std::vector<uint32_t> issued,
    std::vector<uint32_t> revoked,
    const uint8_t accumulator) {
  auto operation = revreg::schema::create_entry_t{};
  operation.definition_id = definition_id;
  operation.issuer_id = issuer_id;
  operation.data.current_accumulator = revreg::schema::bytes_t{accumulator};
  operation.data.issued = std::move(issued);
  operation.data.revoked = std::move(revoked);
  return operation;
}

}  // namespace revreg::testing
