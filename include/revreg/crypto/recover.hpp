#pragma once

#include <revreg/schema/primitives.hpp>
#include <optional>

// Recoverable secp256k1 signatures over 32-byte digests. Signatures are laid
// out r || s || v with v in {0, 1}; 27 and 28 are accepted on input. Only
// low-S signatures recover.
namespace revreg::crypto {

bool available();

std::optional<revreg::schema::private_key_t> generate_private_key();

std::optional<revreg::schema::public_key_t> derive_public_key(
    const revreg::schema::private_key_t& private_key);

/// Last 20 bytes of the BLAKE3 digest of the 64-byte public key.
revreg::schema::address_t make_address(
    const revreg::schema::public_key_t& public_key);

std::optional<revreg::schema::address_t> derive_address(
    const revreg::schema::private_key_t& private_key);

/// Produces a low-S signature with the recovery id in the last byte.
std::optional<revreg::schema::signature_t> sign_digest(
    const revreg::schema::hash32_t& digest,
    const revreg::schema::private_key_t& private_key);

std::optional<revreg::schema::public_key_t> recover_public_key(
    const revreg::schema::hash32_t& digest,
    const revreg::schema::signature_t& signature);

std::optional<revreg::schema::address_t> recover_address(
    const revreg::schema::hash32_t& digest,
    const revreg::schema::signature_t& signature);

}  // namespace revreg::crypto
