#pragma once

#include <revreg/schema/create_definition.hpp>
#include <revreg/schema/create_entry.hpp>
#include <revreg/schema/primitives.hpp>
#include <string_view>

// Signing payloads for delegated writes. Both payloads begin with the 0x19 0x00
// prefix and the registry address so a signature cannot be replayed against a
// different registry. Identifier strings are bound by their BLAKE3 digest.
namespace revreg::schema {

inline constexpr std::string_view kCreateDefinitionOperation =
    "createRevocationRegistryDefinition";
inline constexpr std::string_view kCreateEntryOperation =
    "createRevocationRegistryEntry";
inline constexpr std::string_view kEndorseOperation = "endorseTransaction";

/// Bytes the identity signs to authorize a definition write.
bytes_t make_author_payload(const address_t& registry,
                            const address_t& identity,
                            const create_definition_t& operation);

/// Bytes the identity signs to authorize an entry write.
bytes_t make_author_payload(const address_t& registry,
                            const address_t& identity,
                            const create_entry_t& operation);

/// Bytes the endorser signs to relay an authorized write.
bytes_t make_endorser_payload(const address_t& registry,
                              const address_t& endorser,
                              const hash32_t& author_digest,
                              const signature_t& author_signature);

}  // namespace revreg::schema
