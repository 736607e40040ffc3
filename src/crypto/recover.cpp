#include <revreg/blake3/hash.hpp>
#include <revreg/crypto/recover.hpp>

#include <openssl/rand.h>
#include <secp256k1.h>
#include <secp256k1_recovery.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <memory>

namespace revreg::crypto {

namespace {

using context_ptr =
    std::unique_ptr<secp256k1_context, decltype(&secp256k1_context_destroy)>;

constexpr auto kUncompressedPointSize = size_t{65};
constexpr auto kCompactSignatureSize = size_t{64};

const secp256k1_context* context() {
  static const auto shared = [] {
    auto created = context_ptr{
        secp256k1_context_create(SECP256K1_CONTEXT_SIGN |
                                 SECP256K1_CONTEXT_VERIFY),
        secp256k1_context_destroy};
    auto seed = std::array<uint8_t, 32>{};
    if (created && RAND_bytes(seed.data(), static_cast<int>(seed.size())) == 1 &&
        secp256k1_context_randomize(created.get(), seed.data()) != 1) {
      spdlog::warn("secp256k1 context randomization failed");
    }
    return created;
  }();
  return shared.get();
}

std::optional<revreg::schema::public_key_t> serialize_public_key(
    const secp256k1_pubkey& point) {
  auto encoded = std::array<uint8_t, kUncompressedPointSize>{};
  auto written = encoded.size();
  if (secp256k1_ec_pubkey_serialize(context(), encoded.data(), &written,
                                    &point, SECP256K1_EC_UNCOMPRESSED) != 1 ||
      written != kUncompressedPointSize) {
    return std::nullopt;
  }
  // skip the 0x04 prefix
  auto public_key = revreg::schema::public_key_t{};
  std::copy_n(encoded.data() + 1, public_key.size(), public_key.data());
  return public_key;
}

std::optional<int> normalize_recovery_id(const uint8_t v) {
  if (v <= 1) {
    return v;
  }
  if (v == 27 || v == 28) {
    return v - 27;
  }
  return std::nullopt;
}

}  // namespace

bool available() {
  return context() != nullptr;
}

std::optional<revreg::schema::private_key_t> generate_private_key() {
  if (!available()) {
    return std::nullopt;
  }
  auto key = revreg::schema::private_key_t{};
  for (auto attempt = 0; attempt < 16; ++attempt) {
    if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1) {
      return std::nullopt;
    }
    if (secp256k1_ec_seckey_verify(context(), key.data()) == 1) {
      return key;
    }
  }
  return std::nullopt;
}

std::optional<revreg::schema::public_key_t> derive_public_key(
    const revreg::schema::private_key_t& private_key) {
  if (!available() ||
      secp256k1_ec_seckey_verify(context(), private_key.data()) != 1) {
    return std::nullopt;
  }
  auto point = secp256k1_pubkey{};
  if (secp256k1_ec_pubkey_create(context(), &point, private_key.data()) != 1) {
    return std::nullopt;
  }
  return serialize_public_key(point);
}

revreg::schema::address_t make_address(
    const revreg::schema::public_key_t& public_key) {
  auto digest = revreg::blake3::hash(
      revreg::schema::bytes_view_t{public_key.data(), public_key.size()});
  auto address = revreg::schema::address_t{};
  std::copy(digest.end() - address.size(), digest.end(), address.begin());
  return address;
}

std::optional<revreg::schema::address_t> derive_address(
    const revreg::schema::private_key_t& private_key) {
  auto public_key = derive_public_key(private_key);
  if (!public_key) {
    return std::nullopt;
  }
  return make_address(*public_key);
}

std::optional<revreg::schema::signature_t> sign_digest(
    const revreg::schema::hash32_t& digest,
    const revreg::schema::private_key_t& private_key) {
  if (!available() ||
      secp256k1_ec_seckey_verify(context(), private_key.data()) != 1) {
    return std::nullopt;
  }

  // nullptrs select the RFC 6979 nonce; the result is already low-S.
  auto recoverable = secp256k1_ecdsa_recoverable_signature{};
  if (secp256k1_ecdsa_sign_recoverable(context(), &recoverable, digest.data(),
                                       private_key.data(), nullptr,
                                       nullptr) != 1) {
    return std::nullopt;
  }

  auto signature = revreg::schema::signature_t{};
  auto recovery_id = int{};
  if (secp256k1_ecdsa_recoverable_signature_serialize_compact(
          context(), signature.data(), &recovery_id, &recoverable) != 1 ||
      recovery_id < 0 || recovery_id > 1) {
    return std::nullopt;
  }
  signature[kCompactSignatureSize] = static_cast<uint8_t>(recovery_id);
  return signature;
}

std::optional<revreg::schema::public_key_t> recover_public_key(
    const revreg::schema::hash32_t& digest,
    const revreg::schema::signature_t& signature) {
  auto recovery_id = normalize_recovery_id(signature[kCompactSignatureSize]);
  if (!recovery_id || !available()) {
    return std::nullopt;
  }

  auto recoverable = secp256k1_ecdsa_recoverable_signature{};
  if (secp256k1_ecdsa_recoverable_signature_parse_compact(
          context(), &recoverable, signature.data(), *recovery_id) != 1) {
    return std::nullopt;
  }

  // Only the low-S form of a signature is accepted.
  auto plain = secp256k1_ecdsa_signature{};
  if (secp256k1_ecdsa_recoverable_signature_convert(context(), &plain,
                                                    &recoverable) != 1 ||
      secp256k1_ecdsa_signature_normalize(context(), nullptr, &plain) != 0) {
    return std::nullopt;
  }

  auto point = secp256k1_pubkey{};
  if (secp256k1_ecdsa_recover(context(), &point, &recoverable,
                              digest.data()) != 1) {
    return std::nullopt;
  }
  return serialize_public_key(point);
}

std::optional<revreg::schema::address_t> recover_address(
    const revreg::schema::hash32_t& digest,
    const revreg::schema::signature_t& signature) {
  auto public_key = recover_public_key(digest, signature);
  if (!public_key) {
    return std::nullopt;
  }
  return make_address(*public_key);
}

}  // namespace revreg::crypto
