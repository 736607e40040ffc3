#pragma once

#include <revreg/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: revocation registry definition.
// Registry workflow: immutable accumulator parameters for one issuer. The
// definition bytes are stored and returned verbatim; created_at is set once and
// a non-zero value marks the record as existing.
namespace revreg::schema {

template <uint16_t Version>
struct revocation_registry_definition;

template <>
struct revocation_registry_definition<1> final {
  uint16_t version{1};
  hash32_t id{};
  hash32_t credential_definition_id{};
  std::string issuer_id;
  bytes_t definition;
  timestamp_seconds_t created_at{};
};

using revocation_registry_definition_t = revocation_registry_definition<1>;

}  // namespace revreg::schema
