#pragma once
#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace revreg::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = std::array<uint8_t, 20>;
using private_key_t = std::array<uint8_t, 32>;
// Uncompressed secp256k1 point without the 0x04 prefix (x || y).
using public_key_t = std::array<uint8_t, 64>;
// Recoverable secp256k1 signature laid out as r || s || v.
using signature_t = std::array<uint8_t, 65>;
using timestamp_seconds_t = uint64_t;
// Event-log coordinate (block height). Zero means "no position".
using position_t = uint64_t;

inline constexpr position_t kNoPosition = 0;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string& bytes);
hash32_t make_hash32(const std::string_view& bytes);
std::optional<hash32_t> try_make_hash32(const std::string& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& bytes);
hash32_t make_zero_hash();

std::optional<address_t> try_make_address(const std::string_view& hex);

std::optional<bytes_t> try_from_hex(const std::string_view& hex);
std::string to_hex(const bytes_view_t& bytes);

template <std::size_t N>
std::string to_hex(const std::array<uint8_t, N>& bytes) {
  return to_hex(bytes_view_t{bytes.data(), bytes.size()});
}

template <std::size_t N>
std::optional<std::array<uint8_t, N>> try_make_array(
    const std::string_view& hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != N) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, N>{};
  std::copy(decoded->begin(), decoded->end(), out.begin());
  return out;
}

}  // namespace revreg::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
