#include <revreg/registry/local_directory.hpp>
#include <revreg/schema/identifier.hpp>
#include <revreg/schema/key/registry_keys.hpp>
#include <spdlog/spdlog.h>

using namespace revreg::schema;

namespace {

using encoder_t = revreg::schema::encoding::scale_encoder_t;

}  // namespace

namespace revreg::registry {

local_directory::local_directory(encoder_t& encoder,
                                 revreg::storage::rocksdb_storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

void local_directory::grant_role(const address_t& party, const role_id_t role) {
  auto key = key::make_role_key(encoder_, party);
  storage_.put(encoder_, make_bytes_view(key), static_cast<uint8_t>(role));
  spdlog::info("Granted role '{}' to {}", to_string(role), to_hex(party));
}

std::optional<role_id_t> local_directory::role_of(
    const address_t& party) const {
  auto key = key::make_role_key(encoder_, party);
  auto stored =
      storage_.get<encoder_t, uint8_t>(encoder_, make_bytes_view(key));
  if (!stored) {
    return std::nullopt;
  }
  switch (static_cast<role_id_t>(*stored)) {
    case role_id_t::trustee:
    case role_id_t::endorser:
    case role_id_t::steward:
      return static_cast<role_id_t>(*stored);
  }
  spdlog::warn("Ignoring unknown role value {} for {}", *stored,
               to_hex(party));
  return std::nullopt;
}

void local_directory::set_did_controller(const std::string_view did,
                                         const address_t& controller) {
  auto key = key::make_did_controller_key(encoder_, did);
  storage_.put(encoder_, make_bytes_view(key), controller);
  spdlog::info("Recorded controller {} for {}", to_hex(controller), did);
}

bool local_directory::is_controlled_by(const std::string_view did,
                                       const address_t& identity) const {
  auto key = key::make_did_controller_key(encoder_, did);
  auto controller =
      storage_.get<encoder_t, address_t>(encoder_, make_bytes_view(key));
  if (controller) {
    return *controller == identity;
  }
  auto embedded = try_address_from_did(did);
  return embedded.has_value() && *embedded == identity;
}

void local_directory::register_credential_definition(
    const credential_definition_record_t& record) {
  auto key = key::make_credential_definition_key(encoder_, record.id);
  storage_.put(encoder_, make_bytes_view(key), record);
  spdlog::info("Registered credential definition {} for {}", to_hex(record.id),
               record.issuer_id);
}

std::optional<credential_definition_record_t>
local_directory::resolve_credential_definition(const hash32_t& id) const {
  auto key = key::make_credential_definition_key(encoder_, id);
  return storage_.get<encoder_t, credential_definition_record_t>(
      encoder_, make_bytes_view(key));
}

role_resolver_t local_directory::make_role_resolver() const {
  return [this](const address_t& party) { return role_of(party); };
}

did_controller_resolver_t local_directory::make_did_controller_resolver()
    const {
  return [this](std::string_view did, const address_t& identity) {
    return is_controlled_by(did, identity);
  };
}

credential_definition_resolver_t
local_directory::make_credential_definition_resolver() const {
  return [this](const hash32_t& id) {
    return resolve_credential_definition(id);
  };
}

}  // namespace revreg::registry
