#pragma once
#include <revreg/schema/primitives.hpp>
#include <boost/endian/conversion.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

// Raw key builder. Integers are written big-endian so that RocksDB's bytewise
// comparator orders keys numerically.
namespace revreg::schema::key {

struct builder final {
  revreg::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);

  builder& hash(const std::string_view& str);
  builder& hash(const std::span<const uint8_t>& bytes);

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    auto big = boost::endian::native_to_big(value);
    auto bytes = reinterpret_cast<const uint8_t*>(&big);
    data.insert(std::end(data), bytes, bytes + sizeof(T));
    return *this;
  }
};

}  // namespace revreg::schema::key
