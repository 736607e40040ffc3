#pragma once

#include <revreg/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: authorization denial.
// Registry workflow: reason attached to a not_authorized result.
namespace revreg::schema {

enum class authorization_denial : uint8_t {
  not_permitted_role = 1,
  issuer_not_controlled = 2,
  sender_not_identity = 3,
  issuer_mismatch = 4,
};

inline constexpr auto kAuthorizationDenialMappings = std::array{
    std::pair<std::string_view, authorization_denial>{
        "not_permitted_role", authorization_denial::not_permitted_role},
    std::pair<std::string_view, authorization_denial>{
        "issuer_not_controlled", authorization_denial::issuer_not_controlled},
    std::pair<std::string_view, authorization_denial>{
        "sender_not_identity", authorization_denial::sender_not_identity},
    std::pair<std::string_view, authorization_denial>{
        "issuer_mismatch", authorization_denial::issuer_mismatch},
};

inline constexpr std::string_view to_string(const authorization_denial value) {
  return to_string(value, kAuthorizationDenialMappings).value_or("unknown");
}

}  // namespace revreg::schema
