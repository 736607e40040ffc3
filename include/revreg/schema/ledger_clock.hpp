#pragma once

#include <revreg/schema/primitives.hpp>
#include <cstdint>

// Schema type: ledger clock.
// Registry workflow: current block position and timestamp. Writes are stamped
// with these values; height zero means no block has begun.
namespace revreg::schema {

template <uint16_t Version>
struct ledger_clock;

template <>
struct ledger_clock<1> final {
  uint16_t version{1};
  position_t height{};
  timestamp_seconds_t timestamp{};
};

using ledger_clock_t = ledger_clock<1>;

}  // namespace revreg::schema
