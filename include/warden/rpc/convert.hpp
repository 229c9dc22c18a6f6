#pragma once

#include <warden/schema/audit_entry.hpp>
#include <warden/schema/authorization_record.hpp>
#include <warden/schema/build_job.hpp>
#include <warden/schema/outcome.hpp>
#include <warden/schema/signing_request.hpp>
#include <warden/schema/suspension_record.hpp>
#include <warden/schema/verification_decision.hpp>
#include <warden/v1/warden.pb.h>

#include <optional>
#include <string>

// Mapping between wire messages and schema types.
namespace warden::rpc {

/// 32 raw bytes, or 64 hex characters with optional 0x prefix.
std::optional<warden::schema::hash32_t> try_hash32_from_bytes(
    const std::string& value);
std::optional<warden::schema::signature_t> try_signature_from_bytes(
    const std::string& value);

warden::schema::outcome<warden::schema::build_job_t> from_proto(
    const warden::v1::SubmitBuildJobRequest& request);
warden::schema::outcome<warden::schema::authorization_record_t> from_proto(
    const warden::v1::AuthorizeRequest& request);
warden::schema::outcome<warden::schema::authority_token_t> from_proto(
    const warden::v1::AuthorityToken& token);

void set_status(warden::schema::error_code_t code,
                const std::string& log,
                warden::v1::Status* status);

void to_proto(const warden::schema::verification_decision_t& decision,
              warden::v1::VerificationDecision* out);
void to_proto(const warden::schema::signing_request_t& request,
              warden::v1::SigningRequestSummary* out);
void to_proto(const warden::schema::audit_entry_t& entry,
              warden::v1::AuditEntry* out);
void to_proto(const warden::schema::suspension_record_t& record,
              warden::v1::SuspensionRecord* out);

}  // namespace warden::rpc
