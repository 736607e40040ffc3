#pragma once

#include <revreg/schema/key/builder.hpp>
#include <revreg/schema/primitives.hpp>
#include <cstdint>
#include <string_view>
#include <tuple>

// Schema key type: registry keys.
// Registry workflow: canonical key prefixes and key codecs for definitions,
// chain tails, the ledger clock, the local directory, and the event log.
namespace revreg::schema::key {

inline constexpr std::string_view kDefinitionKeyPrefix{
    "SYS|STATE|REV_REG_DEF|"};
inline constexpr std::string_view kTailKeyPrefix{"SYS|STATE|REV_REG_TAIL|"};
inline constexpr std::string_view kEventSeqKeyPrefix{"SYS|STATE|EVENT_SEQ|"};
inline constexpr std::string_view kLedgerClockKey{"SYS|APP|LEDGER"};
inline constexpr std::string_view kRoleKeyPrefix{"SYS|DIRECTORY|ROLE|"};
inline constexpr std::string_view kDidControllerKeyPrefix{
    "SYS|DIRECTORY|DID|"};
inline constexpr std::string_view kCredentialDefinitionKeyPrefix{
    "SYS|DIRECTORY|CRED_DEF|"};
inline constexpr std::string_view kEntryEventPrefix{"SYS|EVENT|REV_REG_ENTRY|"};
inline constexpr std::string_view kDefinitionEventPrefix{
    "SYS|EVENT|REV_REG_DEF|"};

template <typename Encoder, typename T>
revreg::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                          std::string_view prefix,
                                          const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
revreg::schema::bytes_t make_prefix_key(Encoder& encoder,
                                        std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
revreg::schema::bytes_t make_definition_key(
    Encoder& encoder,
    const revreg::schema::hash32_t& definition_id) {
  return make_prefixed_key(encoder, kDefinitionKeyPrefix, definition_id);
}

template <typename Encoder>
revreg::schema::bytes_t make_tail_key(
    Encoder& encoder,
    const revreg::schema::hash32_t& definition_id) {
  return make_prefixed_key(encoder, kTailKeyPrefix, definition_id);
}

template <typename Encoder>
revreg::schema::bytes_t make_event_sequence_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kEventSeqKeyPrefix,
                           std::string_view{"NEXT"});
}

template <typename Encoder>
revreg::schema::bytes_t make_ledger_clock_key(Encoder& encoder) {
  return make_prefix_key(encoder, kLedgerClockKey);
}

template <typename Encoder>
revreg::schema::bytes_t make_role_key(Encoder& encoder,
                                      const revreg::schema::address_t& party) {
  return make_prefixed_key(encoder, kRoleKeyPrefix, party);
}

template <typename Encoder>
revreg::schema::bytes_t make_did_controller_key(Encoder& encoder,
                                                std::string_view did) {
  return make_prefixed_key(encoder, kDidControllerKeyPrefix, did);
}

template <typename Encoder>
revreg::schema::bytes_t make_credential_definition_key(
    Encoder& encoder,
    const revreg::schema::hash32_t& credential_definition_id) {
  return make_prefixed_key(encoder, kCredentialDefinitionKeyPrefix,
                           credential_definition_id);
}

// Event keys are built raw rather than SCALE encoded: range scans over
// positions rely on the big-endian layout.
inline revreg::schema::bytes_t make_entry_event_key(
    const revreg::schema::hash32_t& definition_id,
    const revreg::schema::position_t position,
    const uint64_t log_index) {
  return builder{}
      .write(kEntryEventPrefix)
      .write(std::span<const uint8_t>{definition_id})
      .write(position)
      .write(log_index)
      .data;
}

inline revreg::schema::bytes_t make_definition_event_key(
    const revreg::schema::position_t position,
    const uint64_t log_index) {
  return builder{}
      .write(kDefinitionEventPrefix)
      .write(position)
      .write(log_index)
      .data;
}

}  // namespace revreg::schema::key
