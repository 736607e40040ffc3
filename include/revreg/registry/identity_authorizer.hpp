#pragma once

#include <revreg/registry/collaborators.hpp>
#include <revreg/schema/authorization_denial.hpp>
#include <revreg/schema/role_id.hpp>
#include <array>
#include <optional>
#include <string_view>

namespace revreg::registry {

inline constexpr auto kSubmissionRoles = std::array{
    revreg::schema::role_id_t::trustee, revreg::schema::role_id_t::endorser,
    revreg::schema::role_id_t::steward};

/// Decides whether an acting party may write on behalf of an identity for a
/// given issuer. The role check runs first; both checks must pass.
class identity_authorizer final {
 public:
  identity_authorizer(role_resolver_t role_resolver,
                      did_controller_resolver_t did_controller_resolver);

  /// std::nullopt when authorized, otherwise the reason for denial.
  std::optional<revreg::schema::authorization_denial> authorize(
      const revreg::schema::address_t& acting_party,
      std::string_view issuer_id,
      const revreg::schema::address_t& identity) const;

 private:
  role_resolver_t role_resolver_;
  did_controller_resolver_t did_controller_resolver_;
};

}  // namespace revreg::registry
