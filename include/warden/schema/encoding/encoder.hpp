#pragma once
#include <warden/schema/primitives.hpp>

#include <optional>
#include <span>

namespace warden::schema::encoding {

/// Build-time selected wire/storage codec. Specialized per library tag.
template <typename Library>
struct encoder {
  template <typename T>
  warden::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, warden::schema::bytes_t& out);

  template <typename T>
  T decode(const warden::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const warden::schema::bytes_view_t& bytes);
};

}  // namespace warden::schema::encoding
