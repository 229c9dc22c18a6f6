#pragma once
#include <warden/schema/enum_string.hpp>
#include <warden/schema/primitives.hpp>

#include <optional>
#include <string>

// Schema type: key record.
// Public view of one key in the signing hierarchy. `handle` is an opaque
// reference into the HSM; private material never appears here.
namespace warden::schema {

enum class key_role_t : uint8_t {
  root = 0,
  repository_signing = 1,
  app_signing = 2,
};

inline constexpr auto kKeyRoleMappings = enum_mappings_t<key_role_t, 3>{{
    {"root", key_role_t::root},
    {"repository_signing", key_role_t::repository_signing},
    {"app_signing", key_role_t::app_signing},
}};

inline constexpr std::string_view to_string(const key_role_t value) {
  return to_string(value, kKeyRoleMappings);
}

template <>
inline std::optional<key_role_t> try_from_string<key_role_t>(
    const std::string_view value) {
  return from_string(value, kKeyRoleMappings);
}

enum class key_status_t : uint8_t {
  active = 0,
  revoked = 1,
};

using key_handle_t = hash32_t;

template <uint16_t Version>
struct key_record;

template <>
struct key_record<1> final {
  uint16_t version{1};
  hash32_t key_id;
  key_role_t role{key_role_t::app_signing};
  key_handle_t handle;
  ed25519_signer_id public_key;
  std::optional<hash32_t> parent_id;
  std::optional<std::string> app_id;
  timestamp_milliseconds_t created_at{};
  key_status_t status{key_status_t::active};
  std::optional<timestamp_milliseconds_t> revoked_at;
};

using key_record_t = key_record<1>;

}  // namespace warden::schema
