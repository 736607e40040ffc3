#pragma once

#include <revreg/schema/credential_definition_record.hpp>
#include <revreg/schema/entry_created_event.hpp>
#include <revreg/schema/primitives.hpp>
#include <revreg/schema/role_id.hpp>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>

namespace revreg::registry {

/// Role held by a submitting party, if any.
using role_resolver_t = std::function<std::optional<revreg::schema::role_id_t>(
    const revreg::schema::address_t& party)>;

/// Whether `identity` controls the issuer DID `issuer_id`.
using did_controller_resolver_t =
    std::function<bool(std::string_view issuer_id,
                       const revreg::schema::address_t& identity)>;

using credential_definition_resolver_t = std::function<
    std::optional<revreg::schema::credential_definition_record_t>(
        const revreg::schema::hash32_t& credential_definition_id)>;

/// Entry notifications for a definition in the inclusive position range.
/// std::nullopt means the log could not be read.
using event_source_t = std::function<
    std::optional<std::vector<revreg::schema::entry_created_event_t>>(
        const revreg::schema::hash32_t& definition_id,
        revreg::schema::position_t from,
        revreg::schema::position_t to)>;

/// Tail pointer of a definition's chain, or std::nullopt when the definition
/// does not exist.
using tail_resolver_t = std::function<std::optional<revreg::schema::position_t>(
    const revreg::schema::hash32_t& definition_id)>;

using address_recoverer_t = std::function<std::optional<
    revreg::schema::address_t>(const revreg::schema::hash32_t& digest,
                               const revreg::schema::signature_t& signature)>;

}  // namespace revreg::registry
