#include <revreg/blake3/hash.hpp>
#include <revreg/schema/encoding/scale/encoder.hpp>
#include <revreg/schema/endorsement.hpp>
#include <revreg/schema/key/builder.hpp>
#include <array>
#include <span>

namespace revreg::schema {

namespace {

constexpr auto kSigningPrefix = std::array<uint8_t, 2>{0x19, 0x00};

revreg::schema::key::builder make_payload_header(const address_t& registry,
                                                 const address_t& signer,
                                                 std::string_view operation) {
  auto payload = revreg::schema::key::builder{};
  payload.write(std::span<const uint8_t>{kSigningPrefix})
      .write(std::span<const uint8_t>{registry})
      .write(std::span<const uint8_t>{signer})
      .write(operation);
  return payload;
}

}  // namespace

bytes_t make_author_payload(const address_t& registry,
                            const address_t& identity,
                            const create_definition_t& operation) {
  auto payload =
      make_payload_header(registry, identity, kCreateDefinitionOperation);
  payload.write(std::span<const uint8_t>{operation.id})
      .write(std::span<const uint8_t>{operation.credential_definition_id})
      .hash(std::string_view{operation.issuer_id})
      .write(make_bytes_view(operation.definition));
  return payload.data;
}

bytes_t make_author_payload(const address_t& registry,
                            const address_t& identity,
                            const create_entry_t& operation) {
  auto encoder = encoding::scale_encoder_t{};
  auto payload = make_payload_header(registry, identity, kCreateEntryOperation);
  payload.write(std::span<const uint8_t>{operation.definition_id})
      .hash(std::string_view{operation.issuer_id})
      .write(make_bytes_view(encoder.encode(operation.data)));
  return payload.data;
}

bytes_t make_endorser_payload(const address_t& registry,
                              const address_t& endorser,
                              const hash32_t& author_digest,
                              const signature_t& author_signature) {
  auto payload = make_payload_header(registry, endorser, kEndorseOperation);
  payload.write(std::span<const uint8_t>{author_digest})
      .write(std::span<const uint8_t>{author_signature});
  return payload.data;
}

}  // namespace revreg::schema
