#pragma once

#include <revreg/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: create definition.
// Registry workflow: operation registering a new revocation registry
// definition.
namespace revreg::schema {

template <uint16_t Version>
struct create_definition;

template <>
struct create_definition<1> final {
  uint16_t version{1};
  hash32_t id{};
  hash32_t credential_definition_id{};
  std::string issuer_id;
  bytes_t definition;
};

using create_definition_t = create_definition<1>;

}  // namespace revreg::schema
