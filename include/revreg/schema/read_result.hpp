#pragma once

#include <cstdint>
#include <optional>
#include <string>

// Schema type: read result.
// Registry workflow: read API envelope. value is engaged only when code is
// zero.
namespace revreg::schema {

template <typename T>
struct read_result final {
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  std::optional<T> value;

  bool ok() const { return code == 0 && value.has_value(); }
};

}  // namespace revreg::schema
