#pragma once
#include <warden/schema/primitives.hpp>

#include <blake3.h>

#include <cstdint>
#include <span>
#include <string_view>

namespace warden::blake3 {

/// Incremental BLAKE3 over several inputs. Used for domain separated ids
/// where a tag precedes the encoded payload.
class hasher final {
 public:
  hasher();
  explicit hasher(const std::string_view& domain);

  hasher& update(const std::string_view& str);
  hasher& update(const warden::schema::bytes_view_t& bytes);

  warden::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_{};
};

warden::schema::hash32_t hash(const std::string_view& str);
warden::schema::hash32_t hash(const warden::schema::bytes_view_t& bytes);

/// hash(len(domain) || domain || bytes)
warden::schema::hash32_t hash(const std::string_view& domain,
                              const warden::schema::bytes_view_t& bytes);

}  // namespace warden::blake3
