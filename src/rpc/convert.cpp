#include <warden/rpc/convert.hpp>

#include <algorithm>

using namespace warden::schema;

namespace warden::rpc {

namespace {

std::string to_wire(const bytes_view_t& bytes) {
  return make_string(bytes);
}

template <typename T>
outcome<T> invalid(std::string log) {
  return make_error<T>(error_code_t::invalid_request, std::move(log));
}

}  // namespace

std::optional<hash32_t> try_hash32_from_bytes(const std::string& value) {
  if (value.size() == 32) {
    auto hash = hash32_t{};
    std::copy_n(value.begin(), hash.size(), hash.begin());
    return hash;
  }
  return try_make_hash32(value);
}

std::optional<signature_t> try_signature_from_bytes(const std::string& value) {
  if (value.size() == 64) {
    auto signature = ed25519_signature_t{};
    std::copy_n(value.begin(), signature.size(), signature.begin());
    return signature_t{signature};
  }
  if (value.size() == 65) {
    auto signature = secp256k1_signature_t{};
    std::copy_n(value.begin(), signature.size(), signature.begin());
    return signature_t{signature};
  }
  return try_parse_signature(value);
}

outcome<build_job_t> from_proto(const v1::SubmitBuildJobRequest& request) {
  auto job = build_job_t{};
  job.app_id = request.app_id();
  job.recipe_id = request.recipe_id();
  job.n = request.n();
  job.k = request.k();
  job.source.locator = request.source().locator();
  job.source.commit = request.source().commit();
  job.source.tag = request.source().tag();
  if (!request.source().signer().empty()) {
    job.source.signer = try_parse_signer(request.source().signer());
    if (!job.source.signer) {
      return invalid<build_job_t>("invalid source signer");
    }
  }
  if (!request.source().signature().empty()) {
    job.source.signature =
        try_signature_from_bytes(request.source().signature());
    if (!job.source.signature) {
      return invalid<build_job_t>("invalid source signature");
    }
  }
  for (const auto& parameter : request.parameters()) {
    job.parameters.push_back(recipe_parameter_t{.name = parameter.name(),
                                                .value = parameter.value()});
  }
  return make_ok(std::move(job));
}

outcome<authorization_record_t> from_proto(
    const v1::AuthorizeRequest& request) {
  auto record = authorization_record_t{};
  record.action = quorum_action_t::sign_artifact;

  auto request_id = try_hash32_from_bytes(request.request_id());
  auto digest = try_hash32_from_bytes(request.digest());
  auto authorizer = try_parse_signer(request.authorizer());
  auto decision =
      try_from_string<authorization_decision_t>(request.decision());
  auto signature = try_signature_from_bytes(request.signature());
  if (!request_id || !digest) {
    return invalid<authorization_record_t>("request id and digest required");
  }
  if (!authorizer) {
    return invalid<authorization_record_t>("invalid authorizer");
  }
  if (!decision) {
    return invalid<authorization_record_t>("decision must be approve or deny");
  }
  if (!signature) {
    return invalid<authorization_record_t>("invalid signature");
  }
  record.request_id = *request_id;
  record.bound_digest = *digest;
  record.authorizer = *authorizer;
  record.decision = *decision;
  record.authorized_at = request.authorized_at();
  record.signature = *signature;
  return make_ok(record);
}

outcome<authority_token_t> from_proto(const v1::AuthorityToken& token) {
  auto out = authority_token_t{};
  auto action = try_from_string<suspension_action_t>(token.action());
  auto kind = try_from_string<suspension_subject_t>(token.subject_kind());
  auto subject = try_hash32_from_bytes(token.subject());
  auto nonce = try_hash32_from_bytes(token.nonce());
  auto authority = try_parse_signer(token.authority());
  auto signature = try_signature_from_bytes(token.signature());
  if (!action || !kind) {
    return invalid<authority_token_t>("invalid token action or subject kind");
  }
  if (!subject || !nonce) {
    return invalid<authority_token_t>("token subject and nonce required");
  }
  if (!authority || !signature) {
    return invalid<authority_token_t>("invalid token authority or signature");
  }
  out.action = *action;
  out.subject_kind = *kind;
  out.subject = *subject;
  out.label = token.label();
  out.reason = token.reason();
  out.issued_at = token.issued_at();
  out.nonce = *nonce;
  out.authority = *authority;
  out.signature = *signature;
  return make_ok(std::move(out));
}

void set_status(const error_code_t code,
                const std::string& log,
                v1::Status* status) {
  status->set_code(static_cast<uint32_t>(code));
  status->set_name(std::string{to_string(code)});
  status->set_log(log);
}

void to_proto(const verification_decision_t& decision,
              v1::VerificationDecision* out) {
  out->set_decision_id(to_wire(decision.decision_id));
  out->set_outcome(std::string{to_string(decision.outcome)});
  if (decision.winning_digest) {
    out->set_winning_digest(to_wire(*decision.winning_digest));
  }
  out->set_n(decision.n);
  out->set_k(decision.k);
  for (const auto& agreeing : decision.agreeing) {
    auto* vote = out->add_agreeing();
    vote->set_builder_id(agreeing.builder_id);
    vote->set_attempt(agreeing.attempt);
    if (decision.winning_digest) {
      vote->set_digest(to_wire(*decision.winning_digest));
    }
  }
  for (const auto& disagreeing : decision.disagreeing) {
    auto* vote = out->add_disagreeing();
    vote->set_builder_id(disagreeing.builder_id);
    vote->set_attempt(disagreeing.attempt);
    vote->set_digest(to_wire(disagreeing.digest));
    for (const auto& report_id : disagreeing.diff_report_ids) {
      vote->add_diff_report_ids(to_wire(report_id));
    }
  }
  for (const auto& builder : decision.failed_builders) {
    out->add_failed_builders(builder);
  }
  for (const auto& report : decision.diff_reports) {
    auto* diff = out->add_diff_reports();
    diff->set_report_id(to_wire(report.report_id));
    diff->set_left_digest(to_wire(report.left_digest));
    diff->set_right_digest(to_wire(report.right_digest));
    diff->set_left_size(report.left_size);
    diff->set_right_size(report.right_size);
    for (const auto& range : report.ranges) {
      auto* delta = diff->add_ranges();
      delta->set_offset(range.offset);
      delta->set_length(range.length);
    }
    diff->set_truncated(report.truncated);
    diff->set_complete(report.complete);
  }
  out->set_decided_at(decision.decided_at);
}

void to_proto(const signing_request_t& request,
              v1::SigningRequestSummary* out) {
  out->set_request_id(to_wire(request.request_id));
  out->set_state(std::string{to_string(request.state)});
  out->set_quorum_state(std::string{to_string(quorum_state_of(request.state))});
  out->set_threshold(request.threshold);
  out->set_approvals(static_cast<uint32_t>(std::count_if(
      request.authorizations.begin(), request.authorizations.end(),
      [](const auto& vote) {
        return vote.decision == authorization_decision_t::approve;
      })));
  out->set_artifact_digest(to_wire(request.artifact_digest));
  out->set_key_id(to_wire(request.key_id));
  if (const auto* done = std::get_if<signed_t>(&request.state)) {
    out->set_signature(to_wire(done->signature));
  }
}

void to_proto(const audit_entry_t& entry, v1::AuditEntry* out) {
  out->set_sequence(entry.sequence);
  out->set_previous_hash(to_wire(entry.previous_hash));
  out->set_type(std::string{to_string(entry.type)});
  out->set_entity_kind(std::string{to_string(entry.entity_kind)});
  out->set_entity_id(to_wire(entry.entity_id));
  out->set_severity(std::string{to_string(entry.severity)});
  out->set_message(entry.message);
  out->set_payload(to_wire(entry.payload));
  out->set_recorded_at(entry.recorded_at);
  out->set_entry_hash(to_wire(entry.entry_hash));
}

void to_proto(const suspension_record_t& record, v1::SuspensionRecord* out) {
  out->set_subject_kind(std::string{to_string(record.subject_kind)});
  out->set_subject(to_wire(record.subject));
  out->set_label(record.label);
  out->set_action(std::string{to_string(record.action)});
  out->set_reason(record.reason);
  out->set_authority(to_string(record.authority));
  out->set_recorded_at(record.recorded_at);
  out->set_audit_sequence(record.audit_sequence);
}

}  // namespace warden::rpc
