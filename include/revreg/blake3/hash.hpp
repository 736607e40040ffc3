#pragma once
#include <revreg/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace revreg::blake3 {

revreg::schema::hash32_t hash(const std::string_view& str);
revreg::schema::hash32_t hash(const revreg::schema::bytes_view_t& bytes);

}  // namespace revreg::blake3
