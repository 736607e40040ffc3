#pragma once

#include <revreg/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: revocation registry entry.
// Registry workflow: one accumulator update. Accumulators and index lists are
// opaque to the registry; they are stored and replayed in order.
namespace revreg::schema {

template <uint16_t Version>
struct revocation_registry_entry_data;

template <>
struct revocation_registry_entry_data<1> final {
  uint16_t version{1};
  bytes_t current_accumulator;
  std::optional<bytes_t> previous_accumulator;
  std::vector<uint32_t> issued;
  std::vector<uint32_t> revoked;
};

using revocation_registry_entry_data_t = revocation_registry_entry_data<1>;

template <uint16_t Version>
struct revocation_registry_entry;

template <>
struct revocation_registry_entry<1> final {
  uint16_t version{1};
  hash32_t definition_id{};
  std::string issuer_id;
  revocation_registry_entry_data_t data;
};

using revocation_registry_entry_t = revocation_registry_entry<1>;

}  // namespace revreg::schema
