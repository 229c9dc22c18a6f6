#pragma once
#include <warden/schema/enum_string.hpp>
#include <warden/schema/primitives.hpp>

#include <optional>
#include <vector>

// Schema type: authorization record and quorum proof.
// A vote is bound to (action, request, digest, decision, time) by the
// authorizer's own signature, so it cannot be replayed against another
// artifact.
namespace warden::schema {

enum class authorization_decision_t : uint8_t {
  approve = 0,
  deny = 1,
};

inline constexpr auto kAuthorizationDecisionMappings =
    enum_mappings_t<authorization_decision_t, 2>{{
        {"approve", authorization_decision_t::approve},
        {"deny", authorization_decision_t::deny},
    }};

inline constexpr std::string_view to_string(
    const authorization_decision_t value) {
  return to_string(value, kAuthorizationDecisionMappings);
}

template <>
inline std::optional<authorization_decision_t>
try_from_string<authorization_decision_t>(const std::string_view value) {
  return from_string(value, kAuthorizationDecisionMappings);
}

enum class quorum_action_t : uint8_t {
  sign_artifact = 0,
  create_key = 1,
  revoke_key = 2,
};

inline constexpr auto kQuorumActionMappings =
    enum_mappings_t<quorum_action_t, 3>{{
        {"sign_artifact", quorum_action_t::sign_artifact},
        {"create_key", quorum_action_t::create_key},
        {"revoke_key", quorum_action_t::revoke_key},
    }};

inline constexpr std::string_view to_string(const quorum_action_t value) {
  return to_string(value, kQuorumActionMappings);
}

template <>
inline std::optional<quorum_action_t> try_from_string<quorum_action_t>(
    const std::string_view value) {
  return from_string(value, kQuorumActionMappings);
}

template <uint16_t Version>
struct authorization_record;

template <>
struct authorization_record<1> final {
  uint16_t version{1};
  quorum_action_t action{quorum_action_t::sign_artifact};
  hash32_t request_id;
  signer_id_t authorizer;
  authorization_decision_t decision{authorization_decision_t::deny};
  hash32_t bound_digest;
  timestamp_milliseconds_t authorized_at{};
  signature_t signature;
};

using authorization_record_t = authorization_record<1>;

template <uint16_t Version>
struct quorum_proof;

/// Collected approvals presented to the key manager. `subject` is the digest
/// being signed, the key id being revoked, or the ceremony subject.
template <>
struct quorum_proof<1> final {
  uint16_t version{1};
  quorum_action_t action{quorum_action_t::sign_artifact};
  hash32_t request_id;
  hash32_t subject;
  std::vector<authorization_record_t> approvals;
};

using quorum_proof_t = quorum_proof<1>;

}  // namespace warden::schema
