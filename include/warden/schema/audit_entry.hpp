#pragma once
#include <warden/schema/enum_string.hpp>
#include <warden/schema/primitives.hpp>

#include <string>

// Schema type: audit entry.
// Append-only hash-chained record. entry_hash covers every other field,
// previous_hash links to the entry before it, sequence 0 is the genesis
// entry.
namespace warden::schema {

enum class audit_event_type_t : uint16_t {
  genesis = 0,
  job_submitted = 1,
  source_verification_failed = 2,
  builder_result_recorded = 4,
  job_cancelled = 5,
  job_timed_out = 6,
  verification_decided = 7,
  signing_requested = 8,
  authorization_recorded = 9,
  authorization_rejected = 10,
  quorum_reached = 11,
  request_denied = 12,
  request_expired = 13,
  artifact_signed = 14,
  signing_failed = 15,
  key_created = 16,
  key_revoked = 17,
  authorization_mismatch = 18,
  hsm_unavailable = 19,
  suspended = 20,
  unsuspended = 21,
  suspension_rejected = 22,
  request_resubmitted = 23,
  request_abandoned = 24,
};

inline constexpr auto kAuditEventTypeMappings =
    enum_mappings_t<audit_event_type_t, 24>{{
        {"genesis", audit_event_type_t::genesis},
        {"job_submitted", audit_event_type_t::job_submitted},
        {"source_verification_failed",
         audit_event_type_t::source_verification_failed},
        {"builder_result_recorded",
         audit_event_type_t::builder_result_recorded},
        {"job_cancelled", audit_event_type_t::job_cancelled},
        {"job_timed_out", audit_event_type_t::job_timed_out},
        {"verification_decided", audit_event_type_t::verification_decided},
        {"signing_requested", audit_event_type_t::signing_requested},
        {"authorization_recorded", audit_event_type_t::authorization_recorded},
        {"authorization_rejected", audit_event_type_t::authorization_rejected},
        {"quorum_reached", audit_event_type_t::quorum_reached},
        {"request_denied", audit_event_type_t::request_denied},
        {"request_expired", audit_event_type_t::request_expired},
        {"artifact_signed", audit_event_type_t::artifact_signed},
        {"signing_failed", audit_event_type_t::signing_failed},
        {"key_created", audit_event_type_t::key_created},
        {"key_revoked", audit_event_type_t::key_revoked},
        {"authorization_mismatch", audit_event_type_t::authorization_mismatch},
        {"hsm_unavailable", audit_event_type_t::hsm_unavailable},
        {"suspended", audit_event_type_t::suspended},
        {"unsuspended", audit_event_type_t::unsuspended},
        {"suspension_rejected", audit_event_type_t::suspension_rejected},
        {"request_resubmitted", audit_event_type_t::request_resubmitted},
        {"request_abandoned", audit_event_type_t::request_abandoned},
    }};

inline constexpr std::string_view to_string(const audit_event_type_t value) {
  return to_string(value, kAuditEventTypeMappings);
}

enum class entity_kind_t : uint8_t {
  system = 0,
  build_job = 1,
  builder_result = 2,
  verification_decision = 3,
  signing_request = 4,
  key = 5,
  suspension = 6,
};

inline constexpr auto kEntityKindMappings = enum_mappings_t<entity_kind_t, 7>{{
    {"system", entity_kind_t::system},
    {"build_job", entity_kind_t::build_job},
    {"builder_result", entity_kind_t::builder_result},
    {"verification_decision", entity_kind_t::verification_decision},
    {"signing_request", entity_kind_t::signing_request},
    {"key", entity_kind_t::key},
    {"suspension", entity_kind_t::suspension},
}};

inline constexpr std::string_view to_string(const entity_kind_t value) {
  return to_string(value, kEntityKindMappings);
}

enum class audit_severity_t : uint8_t {
  info = 0,
  warning = 1,
  error = 2,
  critical = 3,
};

inline constexpr auto kAuditSeverityMappings =
    enum_mappings_t<audit_severity_t, 4>{{
        {"info", audit_severity_t::info},
        {"warning", audit_severity_t::warning},
        {"error", audit_severity_t::error},
        {"critical", audit_severity_t::critical},
    }};

inline constexpr std::string_view to_string(const audit_severity_t value) {
  return to_string(value, kAuditSeverityMappings);
}

/// What a component hands to the audit log. Sequence, linkage and timestamp
/// are assigned by the log.
struct audit_event_t final {
  audit_event_type_t type{audit_event_type_t::genesis};
  entity_kind_t entity_kind{entity_kind_t::system};
  hash32_t entity_id{};
  audit_severity_t severity{audit_severity_t::info};
  std::string message;
  bytes_t payload;
};

template <uint16_t Version>
struct audit_entry;

template <>
struct audit_entry<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  hash32_t previous_hash{};
  audit_event_type_t type{audit_event_type_t::genesis};
  entity_kind_t entity_kind{entity_kind_t::system};
  hash32_t entity_id{};
  audit_severity_t severity{audit_severity_t::info};
  std::string message;
  bytes_t payload;
  timestamp_milliseconds_t recorded_at{};
  hash32_t entry_hash{};
};

using audit_entry_t = audit_entry<1>;

}  // namespace warden::schema
