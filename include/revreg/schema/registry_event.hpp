#pragma once

#include <revreg/schema/registry_event_attribute.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: registry event.
// Registry workflow: indexed emission returned to the submitter alongside a
// write result.
namespace revreg::schema {

template <uint16_t Version>
struct registry_event;

template <>
struct registry_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<registry_event_attribute_t> attributes;
};

using registry_event_t = registry_event<1>;

}  // namespace revreg::schema
