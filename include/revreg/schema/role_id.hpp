#pragma once

#include <revreg/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: role id.
// Registry workflow: submission roles an acting party may hold when writing to
// the revocation registry.
namespace revreg::schema {

enum class role_id_t : uint8_t { trustee = 1, endorser = 2, steward = 3 };

inline constexpr auto kRoleIdMappings = std::array{
    std::pair<std::string_view, role_id_t>{"trustee", role_id_t::trustee},
    std::pair<std::string_view, role_id_t>{"endorser", role_id_t::endorser},
    std::pair<std::string_view, role_id_t>{"steward", role_id_t::steward},
};

template <>
inline std::optional<role_id_t> try_from_string<role_id_t>(
    const std::string_view value) {
  return from_string(value, kRoleIdMappings);
}

inline constexpr std::string_view to_string(const role_id_t value) {
  return to_string(value, kRoleIdMappings).value_or("unknown");
}

}  // namespace revreg::schema
