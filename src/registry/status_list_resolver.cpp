#include <revreg/registry/result.hpp>
#include <revreg/registry/status_list_resolver.hpp>
#include <set>
#include <utility>

using namespace revreg::schema;

namespace revreg::registry {

revocation_status_list_t fold_status_list(
    const revocation_registry_definition_t& definition,
    const std::vector<entry_created_event_t>& history,
    const timestamp_seconds_t timestamp) {
  auto revoked = std::set<uint32_t>{};
  auto status_list = revocation_status_list_t{};
  status_list.definition_id = definition.id;
  status_list.issuer_id = definition.issuer_id;

  for (const auto& event : history) {
    if (event.created_at > timestamp) {
      continue;
    }
    for (const auto index : event.entry.data.issued) {
      revoked.erase(index);
    }
    for (const auto index : event.entry.data.revoked) {
      revoked.insert(index);
    }
    status_list.current_accumulator = event.entry.data.current_accumulator;
    status_list.timestamp = event.created_at;
  }

  status_list.revoked.assign(std::begin(revoked), std::end(revoked));
  return status_list;
}

status_list_resolver::status_list_resolver(
    definition_resolver_t definitions,
    const history_reconstructor& history)
    : definitions_{std::move(definitions)}, history_{history} {}

read_result<revocation_status_list_t> status_list_resolver::resolve_at(
    const hash32_t& definition_id,
    const timestamp_seconds_t timestamp) const {
  auto definition = definitions_(definition_id);
  if (!definition.ok()) {
    auto failed = forward_read_error<revocation_status_list_t>(definition);
    failed.codespace = std::string{kResolveStatusListCodespace};
    return failed;
  }
  auto history = history_.reconstruct(definition_id);
  if (!history.ok()) {
    auto failed = forward_read_error<revocation_status_list_t>(history);
    failed.codespace = std::string{kResolveStatusListCodespace};
    return failed;
  }
  return make_read_ok(
      fold_status_list(*definition.value, *history.value, timestamp));
}

}  // namespace revreg::registry
