#pragma once

#include <revreg/schema/primitives.hpp>
#include <optional>
#include <string>
#include <string_view>

// Identifier derivation for registry objects. Callers hash the same textual
// form on the client and on the ledger so ids agree without coordination.
namespace revreg::schema {

/// BLAKE3 of the UTF-8 bytes of `value`.
hash32_t make_identifier(std::string_view value);

/// `<issuer>/anoncreds/v0/REV_REG_DEF/<cred_def_id>/<tag>`.
std::string make_revocation_registry_definition_id(
    std::string_view issuer_id,
    std::string_view credential_definition_id,
    std::string_view tag);

/// `<issuer>/anoncreds/v0/CLAIM_DEF/<schema_id>/<tag>`.
std::string make_credential_definition_id(std::string_view issuer_id,
                                          std::string_view schema_id,
                                          std::string_view tag);

/// Address embedded in a `did:ethr:[network:]0x<40 hex>` identifier.
std::optional<address_t> try_address_from_did(std::string_view did);

}  // namespace revreg::schema
