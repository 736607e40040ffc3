#pragma once

#include <revreg/crypto/recover.hpp>
#include <revreg/schema/primitives.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace revreg::testing {

inline revreg::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = revreg::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline revreg::schema::address_t make_address(const uint8_t seed) {
  auto out = revreg::schema::address_t{};
  out[0] = seed;
  out[19] = seed;
  return out;
}

/// Deterministic valid secp256k1 scalar.
inline revreg::schema::private_key_t make_private_key(const uint8_t seed) {
  auto out = revreg::schema::private_key_t{};
  out[0] = 0x11;
  out[31] = seed;
  return out;
}

inline revreg::schema::address_t address_of(
    const revreg::schema::private_key_t& private_key) {
  return revreg::crypto::derive_address(private_key).value();
}

/// The (n - s, v ^ 1) twin of a signature, which recovers the same key.
inline revreg::schema::signature_t make_high_s(
    const revreg::schema::signature_t& signature) {
  constexpr auto kOrder = std::array<uint8_t, 32>{
      0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
      0xff, 0xff, 0xff, 0xff, 0xfe, 0xba, 0xae, 0xdc, 0xe6, 0xaf, 0x48,
      0xa0, 0x3b, 0xbf, 0xd2, 0x5e, 0x8c, 0xd0, 0x36, 0x41, 0x41};
  auto out = signature;
  auto borrow = 0;
  for (auto i = 31; i >= 0; --i) {
    auto difference = static_cast<int>(kOrder[i]) -
                      static_cast<int>(signature[32 + i]) - borrow;
    borrow = difference < 0 ? 1 : 0;
    out[32 + i] = static_cast<uint8_t>(difference + (borrow << 8));
  }
  out[64] = static_cast<uint8_t>(signature[64] ^ 1u);
  return out;
}

inline std::string make_ethr_did(const revreg::schema::address_t& address) {
  return "did:ethr:0x" + revreg::schema::to_hex(address);
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace revreg::testing
