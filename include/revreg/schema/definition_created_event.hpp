#pragma once

#include <revreg/schema/primitives.hpp>
#include <cstdint>

// Schema type: definition created event.
// Registry workflow: notification for external observers when a definition is
// accepted.
namespace revreg::schema {

template <uint16_t Version>
struct definition_created_event;

template <>
struct definition_created_event<1> final {
  uint16_t version{1};
  hash32_t definition_id{};
  address_t identity{};
  position_t position{};
  uint64_t log_index{};
};

using definition_created_event_t = definition_created_event<1>;

}  // namespace revreg::schema
