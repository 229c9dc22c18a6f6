#include <warden/blake3/hash.hpp>
#include <warden/crypto/verify.hpp>
#include <warden/keys/quorum.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>

#include <algorithm>
#include <tuple>

using namespace warden::schema;

namespace warden::keys {

hash32_t authorization_message(const quorum_action_t action,
                               const hash32_t& request_id,
                               const hash32_t& bound_digest,
                               const authorization_decision_t decision,
                               const timestamp_milliseconds_t authorized_at) {
  auto encoder = encoding::scale_encoder_t{};
  auto encoded = encoder.encode(
      std::tuple{action, request_id, bound_digest, decision, authorized_at});
  return warden::blake3::hash(kAuthorizationDomain, encoded);
}

hash32_t authorization_message(const authorization_record_t& record) {
  return authorization_message(record.action, record.request_id,
                               record.bound_digest, record.decision,
                               record.authorized_at);
}

bool is_member(const std::vector<signer_id_t>& members,
               const signer_id_t& signer) {
  return std::find(members.begin(), members.end(), signer) != members.end();
}

error_code_t check_authorization(const authorization_record_t& record,
                                 const quorum_policy_t& policy,
                                 const timestamp_milliseconds_t now) {
  if (!is_member(policy.authorizers, record.authorizer)) {
    return error_code_t::authorization_mismatch;
  }
  if (!warden::crypto::verify_signature(authorization_message(record),
                                        record.authorizer, record.signature)) {
    return error_code_t::authorization_mismatch;
  }
  if (record.authorized_at > now ||
      now - record.authorized_at > policy.vote_ttl_ms) {
    return error_code_t::stale_authorization;
  }
  return error_code_t::ok;
}

error_code_t check_proof(const quorum_proof_t& proof,
                         const quorum_action_t action,
                         const hash32_t& subject,
                         const quorum_policy_t& policy,
                         const timestamp_milliseconds_t now) {
  if (proof.action != action || proof.subject != subject) {
    return error_code_t::authorization_mismatch;
  }
  auto seen = std::vector<signer_id_t>{};
  for (const auto& record : proof.approvals) {
    if (record.action != action || record.request_id != proof.request_id ||
        record.bound_digest != subject ||
        record.decision != authorization_decision_t::approve) {
      return error_code_t::authorization_mismatch;
    }
    if (is_member(seen, record.authorizer)) {
      return error_code_t::authorization_mismatch;
    }
    auto code = check_authorization(record, policy, now);
    if (code != error_code_t::ok) {
      return error_code_t::authorization_mismatch;
    }
    seen.push_back(record.authorizer);
  }
  if (policy.threshold == 0 || seen.size() < policy.threshold) {
    return error_code_t::authorization_mismatch;
  }
  return error_code_t::ok;
}

}  // namespace warden::keys
