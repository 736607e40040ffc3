#pragma once

#include <revreg/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: registry error code.
// Registry workflow: stable numeric failure taxonomy shared by the write path
// and the read path. Zero is success.
namespace revreg::schema {

enum class registry_error_code : uint32_t {
  not_found = 1,
  already_exists = 2,
  not_authorized = 3,
  invalid_signature = 4,
  history_source_unavailable = 5,
  credential_definition_not_found = 6,
  invalid_entry = 7,
  no_active_block = 8,
  invalid_block = 9,
};

inline constexpr auto kRegistryErrorCodeMappings = std::array{
    std::pair<std::string_view, registry_error_code>{
        "not_found", registry_error_code::not_found},
    std::pair<std::string_view, registry_error_code>{
        "already_exists", registry_error_code::already_exists},
    std::pair<std::string_view, registry_error_code>{
        "not_authorized", registry_error_code::not_authorized},
    std::pair<std::string_view, registry_error_code>{
        "invalid_signature", registry_error_code::invalid_signature},
    std::pair<std::string_view, registry_error_code>{
        "history_source_unavailable",
        registry_error_code::history_source_unavailable},
    std::pair<std::string_view, registry_error_code>{
        "credential_definition_not_found",
        registry_error_code::credential_definition_not_found},
    std::pair<std::string_view, registry_error_code>{
        "invalid_entry", registry_error_code::invalid_entry},
    std::pair<std::string_view, registry_error_code>{
        "no_active_block", registry_error_code::no_active_block},
    std::pair<std::string_view, registry_error_code>{
        "invalid_block", registry_error_code::invalid_block},
};

inline constexpr std::string_view to_string(const registry_error_code value) {
  return to_string(value, kRegistryErrorCodeMappings).value_or("unknown");
}

inline constexpr uint32_t to_code(const registry_error_code value) {
  return static_cast<uint32_t>(value);
}

/// True for every "does not exist" flavour, including a missing credential
/// definition referenced at creation time.
inline constexpr bool is_not_found(const uint32_t code) {
  return code == to_code(registry_error_code::not_found) ||
         code == to_code(registry_error_code::credential_definition_not_found);
}

}  // namespace revreg::schema
