#pragma once

#include <cstdint>
#include <string>

// Schema type: registry event attribute.
// Registry workflow: key/value/index tuple carried by emitted events.
namespace revreg::schema {

template <uint16_t Version>
struct registry_event_attribute;

template <>
struct registry_event_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
  bool index{};
};

using registry_event_attribute_t = registry_event_attribute<1>;

}  // namespace revreg::schema
