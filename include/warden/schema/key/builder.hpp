#pragma once
#include <warden/schema/primitives.hpp>

#include <boost/endian/conversion.hpp>

#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace warden::schema::key {

/// Byte-wise storage key. Integers are written big-endian so that a prefix
/// scan returns entries in numeric order.
struct builder final {
  warden::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);
  builder& write(const signer_id_t& signer_id);

  builder& hash(const std::string_view& str);

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    auto big = boost::endian::native_to_big(value);
    const auto* raw = reinterpret_cast<const uint8_t*>(&big);
    data.insert(std::end(data), raw, raw + sizeof(T));
    return *this;
  }
};

}  // namespace warden::schema::key
