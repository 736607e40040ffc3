#pragma once

#include <revreg/registry/collaborators.hpp>
#include <revreg/schema/primitives.hpp>
#include <revreg/schema/registry_result.hpp>
#include <revreg/schema/write_request.hpp>
#include <optional>
#include <string_view>

namespace revreg::registry {

/// Identity a write is performed for, and the party that submitted it.
struct resolved_writer final {
  revreg::schema::address_t identity{};
  revreg::schema::address_t acting_party{};
};

/// Digest signed by authors and endorsers.
revreg::schema::hash32_t make_signing_digest(
    const revreg::schema::bytes_t& payload);

/// Author side: sign the digest of an author payload.
std::optional<revreg::schema::signature_t> sign_payload(
    const revreg::schema::bytes_t& payload,
    const revreg::schema::private_key_t& private_key);

/// Endorser side: wrap an author signature into a delegated request signed by
/// `endorser_key`.
std::optional<revreg::schema::delegated_request> endorse(
    const revreg::schema::address_t& registry,
    const revreg::schema::address_t& identity,
    const revreg::schema::bytes_t& author_payload,
    const revreg::schema::signature_t& author_signature,
    const revreg::schema::private_key_t& endorser_key);

/// Resolves a write request into (identity, acting party).
///
/// Direct requests must be sent by the identity itself. Delegated requests
/// need both the author signature over `author_payload` and the endorser
/// signature over the endorsement payload to recover to the claimed parties.
class endorsement_verifier final {
 public:
  explicit endorsement_verifier(revreg::schema::address_t registry,
                                address_recoverer_t recoverer);

  /// On success returns a zero code and fills `resolved`.
  revreg::schema::registry_result_t verify(
      const revreg::schema::write_request_t& request,
      const revreg::schema::bytes_t& author_payload,
      std::string_view codespace,
      resolved_writer& resolved) const;

  const revreg::schema::address_t& registry() const;

 private:
  revreg::schema::address_t registry_;
  address_recoverer_t recoverer_;
};

}  // namespace revreg::registry
