#pragma once

#include <warden/schema/authorization_record.hpp>
#include <warden/schema/error_code.hpp>
#include <warden/schema/primitives.hpp>

#include <cstdint>
#include <vector>

namespace warden::keys {

inline constexpr auto kAuthorizationDomain =
    std::string_view{"warden.authorization.v1"};

/// Who may vote, how many approvals are needed, and how long a vote stays
/// fresh.
struct quorum_policy_t final {
  std::vector<warden::schema::signer_id_t> authorizers;
  uint32_t threshold{};
  warden::schema::duration_milliseconds_t vote_ttl_ms{};
};

/// The message an authorizer signs: binds the vote to one action, one
/// request, one digest and one decision at one time.
warden::schema::hash32_t authorization_message(
    warden::schema::quorum_action_t action,
    const warden::schema::hash32_t& request_id,
    const warden::schema::hash32_t& bound_digest,
    warden::schema::authorization_decision_t decision,
    warden::schema::timestamp_milliseconds_t authorized_at);

warden::schema::hash32_t authorization_message(
    const warden::schema::authorization_record_t& record);

bool is_member(const std::vector<warden::schema::signer_id_t>& members,
               const warden::schema::signer_id_t& signer);

/// Checks one vote: known authorizer, valid signature, not stale, not from
/// the future.
warden::schema::error_code_t check_authorization(
    const warden::schema::authorization_record_t& record,
    const quorum_policy_t& policy,
    warden::schema::timestamp_milliseconds_t now);

/// Checks a whole proof against the action and subject it claims to
/// authorize. Every record must be a valid Approve for that subject from a
/// distinct authorizer, and there must be at least `threshold` of them.
warden::schema::error_code_t check_proof(
    const warden::schema::quorum_proof_t& proof,
    warden::schema::quorum_action_t action,
    const warden::schema::hash32_t& subject,
    const quorum_policy_t& policy,
    warden::schema::timestamp_milliseconds_t now);

}  // namespace warden::keys
