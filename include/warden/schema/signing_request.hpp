#pragma once
#include <warden/schema/authorization_record.hpp>
#include <warden/schema/enum_string.hpp>
#include <warden/schema/primitives.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

// Schema type: signing request.
// AwaitingQuorum -> {Authorized -> Signed} | {Denied | Expired}. The state is
// a tagged variant so that each state carries only what it can know.
namespace warden::schema {

struct awaiting_quorum_t final {
  timestamp_milliseconds_t deadline{};
};

struct authorized_t final {
  timestamp_milliseconds_t authorized_at{};
  // error code of the last failed-closed signing attempt, 0 when none
  uint32_t last_failure{};
};

struct signed_t final {
  ed25519_signature_t signature{};
  timestamp_milliseconds_t signed_at{};
};

struct denied_t final {
  signer_id_t denied_by;
  timestamp_milliseconds_t denied_at{};
};

struct expired_t final {
  timestamp_milliseconds_t expired_at{};
  std::string reason;
};

using signing_state_t =
    std::variant<awaiting_quorum_t, authorized_t, signed_t, denied_t, expired_t>;

inline std::string_view to_string(const signing_state_t& state) {
  return std::visit(
      overloaded{[](const awaiting_quorum_t&) {
                   return std::string_view{"awaiting_quorum"};
                 },
                 [](const authorized_t&) {
                   return std::string_view{"authorized"};
                 },
                 [](const signed_t&) { return std::string_view{"signed"}; },
                 [](const denied_t&) { return std::string_view{"denied"}; },
                 [](const expired_t&) {
                   return std::string_view{"expired"};
                 }},
      state);
}

/// Quorum view reported to authorizers.
enum class quorum_state_t : uint8_t {
  pending = 0,
  reached = 1,
  denied = 2,
  expired = 3,
};

inline constexpr auto kQuorumStateMappings =
    enum_mappings_t<quorum_state_t, 4>{{
        {"pending", quorum_state_t::pending},
        {"reached", quorum_state_t::reached},
        {"denied", quorum_state_t::denied},
        {"expired", quorum_state_t::expired},
    }};

inline constexpr std::string_view to_string(const quorum_state_t value) {
  return to_string(value, kQuorumStateMappings);
}

inline quorum_state_t quorum_state_of(const signing_state_t& state) {
  return std::visit(
      overloaded{
          [](const awaiting_quorum_t&) { return quorum_state_t::pending; },
          [](const authorized_t&) { return quorum_state_t::reached; },
          [](const signed_t&) { return quorum_state_t::reached; },
          [](const denied_t&) { return quorum_state_t::denied; },
          [](const expired_t&) { return quorum_state_t::expired; }},
      state);
}

/// What an Expired request may be resubmitted with.
enum class resubmission_policy_t : uint8_t {
  rebuild = 0,
  reuse_decision = 1,
};

inline constexpr auto kResubmissionPolicyMappings =
    enum_mappings_t<resubmission_policy_t, 2>{{
        {"rebuild", resubmission_policy_t::rebuild},
        {"reuse-decision", resubmission_policy_t::reuse_decision},
    }};

inline constexpr std::string_view to_string(const resubmission_policy_t value) {
  return to_string(value, kResubmissionPolicyMappings);
}

template <>
inline std::optional<resubmission_policy_t>
try_from_string<resubmission_policy_t>(const std::string_view value) {
  return from_string(value, kResubmissionPolicyMappings);
}

template <uint16_t Version>
struct signing_request;

template <>
struct signing_request<1> final {
  uint16_t version{1};
  hash32_t request_id;
  hash32_t job_id;
  hash32_t decision_id;
  hash32_t artifact_digest;
  hash32_t key_id;
  std::string app_id;
  uint32_t threshold{};
  timestamp_milliseconds_t created_at{};
  signing_state_t state;
  std::vector<authorization_record_t> authorizations;
  std::optional<hash32_t> resubmitted_from;
};

using signing_request_t = signing_request<1>;

template <uint16_t Version>
struct publication_record;

/// What the repository/index publisher receives once an artifact is signed.
template <>
struct publication_record<1> final {
  uint16_t version{1};
  hash32_t artifact_digest;
  hash32_t job_id;
  hash32_t request_id;
  std::string app_id;
  hash32_t key_id;
  ed25519_signature_t signature{};
  timestamp_milliseconds_t signed_at{};
};

using publication_record_t = publication_record<1>;

}  // namespace warden::schema
