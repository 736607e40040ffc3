#pragma once

#include <revreg/registry/history_reconstructor.hpp>
#include <revreg/schema/entry_created_event.hpp>
#include <revreg/schema/read_result.hpp>
#include <revreg/schema/revocation_registry_definition.hpp>
#include <revreg/schema/revocation_status_list.hpp>
#include <functional>
#include <vector>

namespace revreg::registry {

inline constexpr auto kResolveStatusListCodespace =
    std::string_view{"revreg.resolve_status_list"};

using definition_resolver_t = std::function<
    revreg::schema::read_result<revreg::schema::revocation_registry_definition_t>(
        const revreg::schema::hash32_t& definition_id)>;

/// Fold `history` (oldest first) into the status list valid at `timestamp`.
///
/// Entries with created_at after `timestamp` are skipped without ending the
/// fold. Entries sharing a created_at apply in chain order.
revreg::schema::revocation_status_list_t fold_status_list(
    const revreg::schema::revocation_registry_definition_t& definition,
    const std::vector<revreg::schema::entry_created_event_t>& history,
    revreg::schema::timestamp_seconds_t timestamp);

/// Resolves the revocation status of a definition as of a point in time.
class status_list_resolver final {
 public:
  status_list_resolver(definition_resolver_t definitions,
                       const history_reconstructor& history);

  revreg::schema::read_result<revreg::schema::revocation_status_list_t>
  resolve_at(const revreg::schema::hash32_t& definition_id,
             revreg::schema::timestamp_seconds_t timestamp) const;

 private:
  definition_resolver_t definitions_;
  const history_reconstructor& history_;
};

}  // namespace revreg::registry
