#pragma once

#include <revreg/schema/read_result.hpp>
#include <revreg/schema/registry_error_code.hpp>
#include <revreg/schema/registry_result.hpp>
#include <string>
#include <string_view>
#include <utility>

namespace revreg::registry {

inline revreg::schema::registry_result_t make_write_error(
    const revreg::schema::registry_error_code code,
    std::string_view codespace,
    std::string log,
    std::string info) {
  auto result = revreg::schema::registry_result_t{};
  result.code = revreg::schema::to_code(code);
  result.codespace = std::string{codespace};
  result.log = std::move(log);
  result.info = std::move(info);
  return result;
}

template <typename T>
revreg::schema::read_result<T> make_read_error(
    const revreg::schema::registry_error_code code,
    std::string_view codespace,
    std::string log,
    std::string info) {
  auto result = revreg::schema::read_result<T>{};
  result.code = revreg::schema::to_code(code);
  result.codespace = std::string{codespace};
  result.log = std::move(log);
  result.info = std::move(info);
  return result;
}

template <typename T>
revreg::schema::read_result<T> make_read_ok(T value) {
  auto result = revreg::schema::read_result<T>{};
  result.value = std::move(value);
  return result;
}

/// Carry a failed read's error fields into a result of another type.
template <typename T, typename U>
revreg::schema::read_result<T> forward_read_error(
    const revreg::schema::read_result<U>& failed) {
  auto result = revreg::schema::read_result<T>{};
  result.code = failed.code;
  result.codespace = failed.codespace;
  result.log = failed.log;
  result.info = failed.info;
  return result;
}

}  // namespace revreg::registry
