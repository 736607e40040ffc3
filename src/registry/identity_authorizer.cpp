#include <revreg/registry/identity_authorizer.hpp>
#include <algorithm>
#include <utility>

namespace revreg::registry {

identity_authorizer::identity_authorizer(
    role_resolver_t role_resolver,
    did_controller_resolver_t did_controller_resolver)
    : role_resolver_{std::move(role_resolver)},
      did_controller_resolver_{std::move(did_controller_resolver)} {}

std::optional<revreg::schema::authorization_denial>
identity_authorizer::authorize(const revreg::schema::address_t& acting_party,
                               const std::string_view issuer_id,
                               const revreg::schema::address_t& identity) const {
  auto role = role_resolver_(acting_party);
  if (!role || std::ranges::find(kSubmissionRoles, *role) ==
                   std::end(kSubmissionRoles)) {
    return revreg::schema::authorization_denial::not_permitted_role;
  }
  if (!did_controller_resolver_(issuer_id, identity)) {
    return revreg::schema::authorization_denial::issuer_not_controlled;
  }
  return std::nullopt;
}

}  // namespace revreg::registry
