#pragma once

#include <revreg/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: credential definition record.
// Registry workflow: pre-existing record a revocation registry definition must
// reference. Only existence and issuer are consumed here.
namespace revreg::schema {

template <uint16_t Version>
struct credential_definition_record;

template <>
struct credential_definition_record<1> final {
  uint16_t version{1};
  hash32_t id{};
  std::string issuer_id;
};

using credential_definition_record_t = credential_definition_record<1>;

}  // namespace revreg::schema
