#pragma once

#include <revreg/schema/registry_result.hpp>
#include <revreg/schema/revocation_registry_entry.hpp>
#include <revreg/schema/revocation_status_list.hpp>
#include <optional>

namespace revreg::registry {

inline constexpr auto kValidateEntryCodespace =
    std::string_view{"revreg.validate_entry"};

/// Checks accumulators are non-empty.
revreg::schema::registry_result_t validate_entry(
    const revreg::schema::revocation_registry_entry_t& entry);

/// Checks a new entry continues the ledger state: same issuer, and a
/// previous accumulator present exactly when the ledger has one, equal to it.
/// An absent status list or one without an accumulator counts as an empty
/// ledger.
revreg::schema::registry_result_t validate_entry_with_status_list(
    const revreg::schema::revocation_registry_entry_t& entry,
    const std::optional<revreg::schema::revocation_status_list_t>& status_list);

}  // namespace revreg::registry
