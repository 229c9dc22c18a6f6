#pragma once

#include <warden/schema/key/builder.hpp>
#include <warden/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

// Schema key type: warden keyspaces.
// Canonical prefixes and key constructors for every persisted record.
namespace warden::schema::key {

inline constexpr std::string_view kJobKeyPrefix{"SYS|STATE|JOB|"};
inline constexpr std::string_view kJobStatusKeyPrefix{"SYS|STATE|JOB_STATUS|"};
inline constexpr std::string_view kJobSequenceKey{"SYS|STATE|JOB_SEQ"};
inline constexpr std::string_view kResultKeyPrefix{"SYS|STATE|RESULT|"};
inline constexpr std::string_view kDecisionKeyPrefix{"SYS|STATE|DECISION|"};
inline constexpr std::string_view kKeyRecordPrefix{"SYS|STATE|KEY|"};
inline constexpr std::string_view kSigningRequestPrefix{
    "SYS|STATE|SIGNING_REQUEST|"};
inline constexpr std::string_view kSigningOpenPrefix{"SYS|STATE|SIGNING_OPEN|"};
inline constexpr std::string_view kPublicationPrefix{"SYS|STATE|PUBLICATION|"};
inline constexpr std::string_view kSuspensionPrefix{"SYS|STATE|SUSPENSION|"};
inline constexpr std::string_view kTokenNoncePrefix{"SYS|STATE|TOKEN_NONCE|"};
inline constexpr std::string_view kSuspensionHistoryPrefix{
    "SYS|HISTORY|SUSPENSION|"};
inline constexpr std::string_view kAuditEntryPrefix{"SYS|AUDIT|ENTRY|"};
inline constexpr std::string_view kAuditTailKey{"SYS|AUDIT|TAIL"};

inline const std::array<std::string_view, 14> kWardenKeyspaces{
    kJobKeyPrefix,           kJobStatusKeyPrefix,   kJobSequenceKey,
    kResultKeyPrefix,        kDecisionKeyPrefix,    kKeyRecordPrefix,
    kSigningRequestPrefix,   kSigningOpenPrefix,    kPublicationPrefix,
    kSuspensionPrefix,       kTokenNoncePrefix,     kSuspensionHistoryPrefix,
    kAuditEntryPrefix,       kAuditTailKey};

inline bytes_t make_prefix_key(const std::string_view prefix) {
  return builder{}.write(prefix).data;
}

inline bytes_t make_id_key(const std::string_view prefix, const hash32_t& id) {
  return builder{}.write(prefix).write(std::span{id}).data;
}

inline bytes_t make_job_key(const hash32_t& job_id) {
  return make_id_key(kJobKeyPrefix, job_id);
}

inline bytes_t make_job_status_key(const hash32_t& job_id) {
  return make_id_key(kJobStatusKeyPrefix, job_id);
}

inline bytes_t make_result_prefix_key(const hash32_t& job_id) {
  return make_id_key(kResultKeyPrefix, job_id);
}

/// RESULT|job|builder index|attempt. Lists a job's results in builder then
/// attempt order.
inline bytes_t make_result_key(const hash32_t& job_id,
                               const uint32_t builder_index,
                               const uint32_t attempt) {
  return builder{}
      .write(kResultKeyPrefix)
      .write(std::span{job_id})
      .write(builder_index)
      .write(attempt)
      .data;
}

inline bytes_t make_decision_key(const hash32_t& decision_id) {
  return make_id_key(kDecisionKeyPrefix, decision_id);
}

inline bytes_t make_key_record_key(const hash32_t& key_id) {
  return make_id_key(kKeyRecordPrefix, key_id);
}

inline bytes_t make_signing_request_key(const hash32_t& request_id) {
  return make_id_key(kSigningRequestPrefix, request_id);
}

/// Present while a request for this artifact digest is awaiting quorum or
/// authorized but not yet signed.
inline bytes_t make_signing_open_key(const hash32_t& artifact_digest) {
  return make_id_key(kSigningOpenPrefix, artifact_digest);
}

inline bytes_t make_publication_key(const hash32_t& artifact_digest) {
  return make_id_key(kPublicationPrefix, artifact_digest);
}

inline bytes_t make_suspension_key(const uint8_t subject_kind,
                                   const hash32_t& subject) {
  return builder{}
      .write(kSuspensionPrefix)
      .write(subject_kind)
      .write(std::span{subject})
      .data;
}

inline bytes_t make_suspension_history_prefix_key(const uint8_t subject_kind,
                                                  const hash32_t& subject) {
  return builder{}
      .write(kSuspensionHistoryPrefix)
      .write(subject_kind)
      .write(std::span{subject})
      .data;
}

inline bytes_t make_suspension_history_key(const uint8_t subject_kind,
                                           const hash32_t& subject,
                                           const uint64_t recorded_sequence) {
  auto key = make_suspension_history_prefix_key(subject_kind, subject);
  return builder{std::move(key)}.write(recorded_sequence).data;
}

inline bytes_t make_token_nonce_key(const hash32_t& nonce) {
  return make_id_key(kTokenNoncePrefix, nonce);
}

inline bytes_t make_audit_entry_key(const uint64_t sequence) {
  return builder{}.write(kAuditEntryPrefix).write(sequence).data;
}

}  // namespace warden::schema::key
