#pragma once

#include <warden/schema/enum_string.hpp>

#include <cstdint>

// Error taxonomy shared by every component and returned on the wire.
namespace warden::schema {

enum class error_code_t : uint32_t {
  ok = 0,
  invalid_request = 1,
  not_found = 2,

  source_verification_failed = 10,
  builder_timeout = 11,
  builder_failed = 12,
  insufficient_builders = 13,
  no_consensus = 14,
  job_cancelled = 15,
  job_finalized = 16,

  consensus_required = 20,
  authorization_mismatch = 21,
  denied = 22,
  expired = 23,
  duplicate_authorization = 24,
  stale_authorization = 25,
  request_outstanding = 26,
  request_finalized = 27,
  resubmission_requires_rebuild = 28,

  hsm_unavailable = 30,
  hsm_timeout = 31,
  hsm_auth_failed = 32,
  key_missing = 33,
  key_revoked = 34,
  key_hierarchy_violation = 35,
  root_exists = 36,

  suspension_unauthorized = 40,
  already_suspended = 41,
  not_suspended = 42,
  token_replayed = 43,

  audit_chain_broken = 50,
};

inline constexpr auto kErrorCodeMappings = enum_mappings_t<error_code_t, 31>{{
    {"ok", error_code_t::ok},
    {"invalid_request", error_code_t::invalid_request},
    {"not_found", error_code_t::not_found},
    {"source_verification_failed", error_code_t::source_verification_failed},
    {"builder_timeout", error_code_t::builder_timeout},
    {"builder_failed", error_code_t::builder_failed},
    {"insufficient_builders", error_code_t::insufficient_builders},
    {"no_consensus", error_code_t::no_consensus},
    {"job_cancelled", error_code_t::job_cancelled},
    {"job_finalized", error_code_t::job_finalized},
    {"consensus_required", error_code_t::consensus_required},
    {"authorization_mismatch", error_code_t::authorization_mismatch},
    {"denied", error_code_t::denied},
    {"expired", error_code_t::expired},
    {"duplicate_authorization", error_code_t::duplicate_authorization},
    {"stale_authorization", error_code_t::stale_authorization},
    {"request_outstanding", error_code_t::request_outstanding},
    {"request_finalized", error_code_t::request_finalized},
    {"resubmission_requires_rebuild",
     error_code_t::resubmission_requires_rebuild},
    {"hsm_unavailable", error_code_t::hsm_unavailable},
    {"hsm_timeout", error_code_t::hsm_timeout},
    {"hsm_auth_failed", error_code_t::hsm_auth_failed},
    {"key_missing", error_code_t::key_missing},
    {"key_revoked", error_code_t::key_revoked},
    {"key_hierarchy_violation", error_code_t::key_hierarchy_violation},
    {"root_exists", error_code_t::root_exists},
    {"suspension_unauthorized", error_code_t::suspension_unauthorized},
    {"already_suspended", error_code_t::already_suspended},
    {"not_suspended", error_code_t::not_suspended},
    {"token_replayed", error_code_t::token_replayed},
    {"audit_chain_broken", error_code_t::audit_chain_broken},
}};

inline constexpr std::string_view to_string(const error_code_t value) {
  return to_string(value, kErrorCodeMappings);
}

}  // namespace warden::schema
