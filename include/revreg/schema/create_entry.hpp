#pragma once

#include <revreg/schema/primitives.hpp>
#include <revreg/schema/revocation_registry_entry.hpp>
#include <cstdint>
#include <string>

// Schema type: create entry.
// Registry workflow: operation appending an accumulator update to a definition.
namespace revreg::schema {

template <uint16_t Version>
struct create_entry;

template <>
struct create_entry<1> final {
  uint16_t version{1};
  hash32_t definition_id{};
  std::string issuer_id;
  revocation_registry_entry_data_t data;
};

using create_entry_t = create_entry<1>;

}  // namespace revreg::schema
