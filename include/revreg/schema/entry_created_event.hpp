#pragma once

#include <revreg/schema/primitives.hpp>
#include <revreg/schema/revocation_registry_entry.hpp>
#include <cstdint>

// Schema type: entry created event.
// Registry workflow: notification emitted for every accepted entry. The
// previous_position field links to the block holding the prior entry of the
// same definition, and is the only way history can be walked.
namespace revreg::schema {

template <uint16_t Version>
struct entry_created_event;

template <>
struct entry_created_event<1> final {
  uint16_t version{1};
  hash32_t definition_id{};
  timestamp_seconds_t created_at{};
  position_t previous_position{};
  revocation_registry_entry_t entry;
  position_t position{};
  uint64_t log_index{};
};

using entry_created_event_t = entry_created_event<1>;

}  // namespace revreg::schema
