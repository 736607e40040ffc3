#include <revreg/blake3/hash.hpp>
#include <revreg/schema/identifier.hpp>
#include <fmt/format.h>

namespace revreg::schema {

namespace {

constexpr auto kEthrDidPrefix = std::string_view{"did:ethr:"};

}  // namespace

hash32_t make_identifier(const std::string_view value) {
  return revreg::blake3::hash(value);
}

std::string make_revocation_registry_definition_id(
    const std::string_view issuer_id,
    const std::string_view credential_definition_id,
    const std::string_view tag) {
  return fmt::format("{}/anoncreds/v0/REV_REG_DEF/{}/{}", issuer_id,
                     credential_definition_id, tag);
}

std::string make_credential_definition_id(const std::string_view issuer_id,
                                          const std::string_view schema_id,
                                          const std::string_view tag) {
  return fmt::format("{}/anoncreds/v0/CLAIM_DEF/{}/{}", issuer_id, schema_id,
                     tag);
}

std::optional<address_t> try_address_from_did(const std::string_view did) {
  if (!did.starts_with(kEthrDidPrefix)) {
    return std::nullopt;
  }
  auto rest = did.substr(kEthrDidPrefix.size());
  auto separator = rest.rfind(':');
  if (separator != std::string_view::npos) {
    rest = rest.substr(separator + 1);
  }
  if (!rest.starts_with("0x") || rest.size() != 42) {
    return std::nullopt;
  }
  return try_make_address(rest);
}

}  // namespace revreg::schema
