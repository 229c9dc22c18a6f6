#pragma once
#include <warden/schema/enum_string.hpp>
#include <warden/schema/primitives.hpp>

#include <optional>
#include <string>

// Schema type: suspension authority token and suspension record.
namespace warden::schema {

enum class suspension_action_t : uint8_t {
  suspend = 0,
  unsuspend = 1,
};

inline constexpr auto kSuspensionActionMappings =
    enum_mappings_t<suspension_action_t, 2>{{
        {"suspend", suspension_action_t::suspend},
        {"unsuspend", suspension_action_t::unsuspend},
    }};

inline constexpr std::string_view to_string(const suspension_action_t value) {
  return to_string(value, kSuspensionActionMappings);
}

template <>
inline std::optional<suspension_action_t>
try_from_string<suspension_action_t>(const std::string_view value) {
  return from_string(value, kSuspensionActionMappings);
}

enum class suspension_subject_t : uint8_t {
  artifact = 0,
  application = 1,
};

inline constexpr auto kSuspensionSubjectMappings =
    enum_mappings_t<suspension_subject_t, 2>{{
        {"artifact", suspension_subject_t::artifact},
        {"application", suspension_subject_t::application},
    }};

inline constexpr std::string_view to_string(const suspension_subject_t value) {
  return to_string(value, kSuspensionSubjectMappings);
}

template <>
inline std::optional<suspension_subject_t>
try_from_string<suspension_subject_t>(const std::string_view value) {
  return from_string(value, kSuspensionSubjectMappings);
}

template <uint16_t Version>
struct authority_token;

/// Signed, single-use capability. `subject` is the artifact digest or the
/// application id hash depending on `subject_kind`; `label` carries the
/// human-readable application id.
template <>
struct authority_token<1> final {
  uint16_t version{1};
  suspension_action_t action{suspension_action_t::suspend};
  suspension_subject_t subject_kind{suspension_subject_t::artifact};
  hash32_t subject{};
  std::string label;
  std::string reason;
  timestamp_milliseconds_t issued_at{};
  hash32_t nonce{};
  signer_id_t authority;
  signature_t signature;
};

using authority_token_t = authority_token<1>;

template <uint16_t Version>
struct suspension_record;

template <>
struct suspension_record<1> final {
  uint16_t version{1};
  suspension_subject_t subject_kind{suspension_subject_t::artifact};
  hash32_t subject{};
  std::string label;
  suspension_action_t action{suspension_action_t::suspend};
  std::string reason;
  signer_id_t authority;
  hash32_t token_nonce{};
  timestamp_milliseconds_t recorded_at{};
  uint64_t audit_sequence{};
};

using suspension_record_t = suspension_record<1>;

}  // namespace warden::schema
