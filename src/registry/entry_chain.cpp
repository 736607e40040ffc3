#include <revreg/registry/entry_chain.hpp>
#include <revreg/registry/result.hpp>
#include <revreg/schema/key/registry_keys.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

using namespace revreg::schema;

namespace revreg::registry {

entry_chain::entry_chain(encoding::scale_encoder_t& encoder,
                         revreg::storage::rocksdb_storage_t& storage,
                         revreg::storage::event_log& events,
                         const definition_store& definitions,
                         const identity_authorizer& authorizer)
    : encoder_{encoder},
      storage_{storage},
      events_{events},
      definitions_{definitions},
      authorizer_{authorizer} {}

registry_result_t entry_chain::append(const create_entry_t& operation,
                                      const address_t& identity,
                                      const address_t& acting_party,
                                      const ledger_clock_t& clock) {
  auto id_hex = to_hex(operation.definition_id);
  auto definition = definitions_.resolve(operation.definition_id);
  if (!definition.ok()) {
    return make_write_error(registry_error_code::not_found,
                            kCreateEntryCodespace, definition.log,
                            definition.info);
  }
  if (operation.issuer_id != definition.value->issuer_id) {
    return make_write_error(
        registry_error_code::not_authorized, kCreateEntryCodespace,
        "entry issuer does not match definition issuer",
        fmt::format("id={} reason={} issuer={} definition_issuer={}", id_hex,
                    to_string(authorization_denial::issuer_mismatch),
                    operation.issuer_id, definition.value->issuer_id));
  }
  if (auto denial = authorizer_.authorize(
          acting_party, definition.value->issuer_id, identity)) {
    return make_write_error(
        registry_error_code::not_authorized, kCreateEntryCodespace,
        "not authorized to create revocation registry entry",
        fmt::format("id={} reason={} issuer={} identity={}", id_hex,
                    to_string(*denial), definition.value->issuer_id,
                    to_hex(identity)));
  }

  auto tail = definitions_.last_entry_position(operation.definition_id);
  if (!tail.ok()) {
    return make_write_error(registry_error_code::not_found,
                            kCreateEntryCodespace, tail.log, tail.info);
  }

  auto event = entry_created_event_t{};
  event.definition_id = operation.definition_id;
  event.created_at = clock.timestamp;
  event.previous_position = *tail.value;
  event.entry.definition_id = operation.definition_id;
  event.entry.issuer_id = operation.issuer_id;
  event.entry.data = operation.data;
  event.position = clock.height;
  event.log_index = events_.next_log_index();

  auto batch = std::vector<revreg::storage::key_value_entry_t>{};
  events_.stage_entry(event, batch);
  batch.emplace_back(key::make_tail_key(encoder_, operation.definition_id),
                     encoder_.encode(position_t{clock.height}));
  storage_.write_batch(batch);

  spdlog::debug("Linked entry for {} at position {} to previous position {}",
                id_hex, event.position, event.previous_position);

  auto result = registry_result_t{};
  result.codespace = std::string{kCreateEntryCodespace};
  result.position = clock.height;
  result.info = fmt::format("id={}", id_hex);
  result.events.push_back(registry_event_t{
      .type = "RevocationRegistryEntryCreated",
      .attributes = {
          registry_event_attribute_t{.key = "revocationRegistryDefinitionId",
                                     .value = id_hex,
                                     .index = true},
          registry_event_attribute_t{
              .key = "timestamp",
              .value = std::to_string(event.created_at),
              .index = false},
          registry_event_attribute_t{
              .key = "previousPosition",
              .value = std::to_string(event.previous_position),
              .index = false},
          registry_event_attribute_t{
              .key = "logIndex",
              .value = std::to_string(event.log_index),
              .index = false}}});
  return result;
}

}  // namespace revreg::registry
