#pragma once

#include <revreg/schema/primitives.hpp>
#include <variant>

// Schema type: write request.
// Registry workflow: who is submitting a write. A direct request is sent by the
// identity itself; a delegated request is relayed by an endorser carrying the
// identity's signature over the operation and the endorser's own signature
// over that authorization.
namespace revreg::schema {

struct direct_request final {
  address_t sender{};
  address_t identity{};
};

struct delegated_request final {
  address_t identity{};
  address_t endorser{};
  signature_t author_signature{};
  signature_t endorser_signature{};
};

using write_request_t = std::variant<direct_request, delegated_request>;

}  // namespace revreg::schema
