#include <revreg/registry/definition_store.hpp>
#include <revreg/registry/result.hpp>
#include <revreg/schema/key/registry_keys.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <utility>

using namespace revreg::schema;

namespace {

using encoder_t = revreg::schema::encoding::scale_encoder_t;

}  // namespace

namespace revreg::registry {

definition_store::definition_store(
    encoder_t& encoder,
    revreg::storage::rocksdb_storage_t& storage,
    revreg::storage::event_log& events,
    const identity_authorizer& authorizer,
    credential_definition_resolver_t credential_definitions)
    : encoder_{encoder},
      storage_{storage},
      events_{events},
      authorizer_{authorizer},
      credential_definitions_{std::move(credential_definitions)} {}

registry_result_t definition_store::create(
    const create_definition_t& operation,
    const address_t& identity,
    const address_t& acting_party,
    const ledger_clock_t& clock) {
  auto id_hex = to_hex(operation.id);
  if (exists(operation.id)) {
    return make_write_error(registry_error_code::already_exists,
                            kCreateDefinitionCodespace,
                            "revocation registry definition already exists",
                            fmt::format("id={}", id_hex));
  }
  if (!credential_definitions_(operation.credential_definition_id)) {
    return make_write_error(
        registry_error_code::credential_definition_not_found,
        kCreateDefinitionCodespace, "credential definition not found",
        fmt::format("id={} credential_definition_id={}", id_hex,
                    to_hex(operation.credential_definition_id)));
  }
  if (auto denial =
          authorizer_.authorize(acting_party, operation.issuer_id, identity)) {
    return make_write_error(
        registry_error_code::not_authorized, kCreateDefinitionCodespace,
        "not authorized to create revocation registry definition",
        fmt::format("id={} reason={} issuer={} identity={}", id_hex,
                    to_string(*denial), operation.issuer_id,
                    to_hex(identity)));
  }

  auto definition = revocation_registry_definition_t{};
  definition.id = operation.id;
  definition.credential_definition_id = operation.credential_definition_id;
  definition.issuer_id = operation.issuer_id;
  definition.definition = operation.definition;
  definition.created_at = clock.timestamp;

  auto event = definition_created_event_t{};
  event.definition_id = operation.id;
  event.identity = identity;
  event.position = clock.height;
  event.log_index = events_.next_log_index();

  auto batch = std::vector<revreg::storage::key_value_entry_t>{};
  batch.emplace_back(key::make_definition_key(encoder_, operation.id),
                     encoder_.encode(definition));
  batch.emplace_back(key::make_tail_key(encoder_, operation.id),
                     encoder_.encode(position_t{kNoPosition}));
  events_.stage_definition_created(event, batch);
  storage_.write_batch(batch);

  auto result = registry_result_t{};
  result.codespace = std::string{kCreateDefinitionCodespace};
  result.position = clock.height;
  result.info = fmt::format("id={}", id_hex);
  result.events.push_back(registry_event_t{
      .type = "RevocationRegistryDefinitionCreated",
      .attributes = {
          registry_event_attribute_t{
              .key = "revocationRegistryDefinitionId",
              .value = id_hex,
              .index = true},
          registry_event_attribute_t{
              .key = "identity", .value = to_hex(identity), .index = true}}});
  return result;
}

read_result<revocation_registry_definition_t> definition_store::resolve(
    const hash32_t& id) const {
  auto key = key::make_definition_key(encoder_, id);
  auto definition = storage_.get<encoder_t, revocation_registry_definition_t>(
      encoder_, make_bytes_view(key));
  if (!definition || definition->created_at == 0) {
    return make_read_error<revocation_registry_definition_t>(
        registry_error_code::not_found, kResolveDefinitionCodespace,
        "revocation registry definition not found",
        fmt::format("id={}", to_hex(id)));
  }
  return make_read_ok(std::move(*definition));
}

read_result<position_t> definition_store::last_entry_position(
    const hash32_t& id) const {
  if (!exists(id)) {
    return make_read_error<position_t>(
        registry_error_code::not_found, kResolveDefinitionCodespace,
        "revocation registry definition not found",
        fmt::format("id={}", to_hex(id)));
  }
  auto key = key::make_tail_key(encoder_, id);
  auto tail =
      storage_.get<encoder_t, position_t>(encoder_, make_bytes_view(key));
  return make_read_ok(tail.value_or(kNoPosition));
}

bool definition_store::exists(const hash32_t& id) const {
  return resolve(id).ok();
}

}  // namespace revreg::registry
