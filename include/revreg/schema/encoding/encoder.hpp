#pragma once
#include <revreg/schema/primitives.hpp>
#include <optional>
#include <span>

namespace revreg::schema::encoding {

// Codec selection is a build time choice: callers name the library through a
// tag type (e.g. encoder<scale_encoder_tag>) and the specialization supplies
// the implementation. Hot swapping codecs is not supported.
template <typename Library>
struct encoder {
  template <typename T>
  revreg::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, revreg::schema::bytes_t& out);

  template <typename T>
  T decode(const revreg::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const revreg::schema::bytes_view_t& bytes);
};

}  // namespace revreg::schema::encoding
