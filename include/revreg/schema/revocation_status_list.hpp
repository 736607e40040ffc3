#pragma once

#include <revreg/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: revocation status list.
// Registry workflow: revoked index set and accumulator valid as of timestamp.
namespace revreg::schema {

template <uint16_t Version>
struct revocation_status_list;

template <>
struct revocation_status_list<1> final {
  uint16_t version{1};
  hash32_t definition_id{};
  std::string issuer_id;
  timestamp_seconds_t timestamp{};
  std::optional<bytes_t> current_accumulator;
  // Sorted ascending, no duplicates.
  std::vector<uint32_t> revoked;
};

using revocation_status_list_t = revocation_status_list<1>;

/// Render the revoked set as a 0/1 list of `size` slots. Indices at or beyond
/// `size` are dropped.
std::vector<uint32_t> make_revocation_list(
    const revocation_status_list_t& status_list,
    uint32_t size);

}  // namespace revreg::schema
