#include <revreg/blake3/hash.hpp>
#include <revreg/crypto/recover.hpp>
#include <revreg/registry/endorsement.hpp>
#include <revreg/registry/result.hpp>
#include <revreg/schema/authorization_denial.hpp>
#include <revreg/schema/endorsement.hpp>
#include <fmt/format.h>
#include <utility>

using namespace revreg::schema;

namespace revreg::registry {

hash32_t make_signing_digest(const bytes_t& payload) {
  return revreg::blake3::hash(make_bytes_view(payload));
}

std::optional<signature_t> sign_payload(const bytes_t& payload,
                                        const private_key_t& private_key) {
  return revreg::crypto::sign_digest(make_signing_digest(payload),
                                     private_key);
}

std::optional<delegated_request> endorse(const address_t& registry,
                                         const address_t& identity,
                                         const bytes_t& author_payload,
                                         const signature_t& author_signature,
                                         const private_key_t& endorser_key) {
  auto endorser = revreg::crypto::derive_address(endorser_key);
  if (!endorser) {
    return std::nullopt;
  }
  auto endorser_payload =
      make_endorser_payload(registry, *endorser,
                            make_signing_digest(author_payload),
                            author_signature);
  auto endorser_signature = sign_payload(endorser_payload, endorser_key);
  if (!endorser_signature) {
    return std::nullopt;
  }
  auto request = delegated_request{};
  request.identity = identity;
  request.endorser = *endorser;
  request.author_signature = author_signature;
  request.endorser_signature = *endorser_signature;
  return request;
}

endorsement_verifier::endorsement_verifier(address_t registry,
                                           address_recoverer_t recoverer)
    : registry_{std::move(registry)}, recoverer_{std::move(recoverer)} {}

const address_t& endorsement_verifier::registry() const {
  return registry_;
}

registry_result_t endorsement_verifier::verify(
    const write_request_t& request,
    const bytes_t& author_payload,
    const std::string_view codespace,
    resolved_writer& resolved) const {
  auto result = registry_result_t{};
  std::visit(
      overloaded{
          [&](const direct_request& value) {
            if (value.sender != value.identity) {
              result = make_write_error(
                  registry_error_code::not_authorized, codespace,
                  "direct request must be sent by the identity",
                  fmt::format(
                      "reason={} sender={} identity={}",
                      to_string(authorization_denial::sender_not_identity),
                      to_hex(value.sender), to_hex(value.identity)));
              return;
            }
            resolved.identity = value.identity;
            resolved.acting_party = value.sender;
          },
          [&](const delegated_request& value) {
            auto author_digest = make_signing_digest(author_payload);
            auto author = recoverer_(author_digest, value.author_signature);
            if (!author || *author != value.identity) {
              result = make_write_error(
                  registry_error_code::invalid_signature, codespace,
                  "author signature does not match identity",
                  fmt::format("identity={} recovered={}",
                              to_hex(value.identity),
                              author ? to_hex(*author) : std::string{"none"}));
              return;
            }
            auto endorser_payload = make_endorser_payload(
                registry_, value.endorser, author_digest,
                value.author_signature);
            auto endorser = recoverer_(make_signing_digest(endorser_payload),
                                       value.endorser_signature);
            if (!endorser || *endorser != value.endorser) {
              result = make_write_error(
                  registry_error_code::invalid_signature, codespace,
                  "endorser signature does not match endorser",
                  fmt::format("endorser={} recovered={}",
                              to_hex(value.endorser),
                              endorser ? to_hex(*endorser)
                                       : std::string{"none"}));
              return;
            }
            resolved.identity = value.identity;
            resolved.acting_party = value.endorser;
          }},
      request);
  return result;
}

}  // namespace revreg::registry
