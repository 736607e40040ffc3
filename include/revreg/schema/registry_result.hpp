#pragma once

#include <revreg/schema/primitives.hpp>
#include <revreg/schema/registry_event.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: registry result.
// Registry workflow: write API envelope. code zero means the write was applied;
// position is the ledger block it was applied in.
namespace revreg::schema {

template <uint16_t Version>
struct registry_result;

template <>
struct registry_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<registry_event_t> events;
  position_t position{};
};

using registry_result_t = registry_result<1>;

}  // namespace revreg::schema
