#include <warden/blake3/hash.hpp>
#include <warden/common/critical.hpp>
#include <warden/schema/key/keyspace.hpp>
#include <warden/signing/service.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <tuple>
#include <utility>

using namespace warden::schema;

namespace warden::signing {

namespace {

outcome<signing_request_t> with_request(const error_code_t code,
                                        std::string log,
                                        const signing_request_t& request) {
  auto result = make_error<signing_request_t>(code, std::move(log));
  result.value = request;
  return result;
}

}  // namespace

service::service(encoding::scale_encoder_t& encoder,
                 warden::storage::rocksdb_storage_t& storage,
                 warden::audit::log& audit,
                 warden::keys::manager& keys,
                 service_options options,
                 time_source_t clock)
    : encoder_{encoder},
      storage_{storage},
      audit_{audit},
      keys_{keys},
      options_{std::move(options)},
      clock_{std::move(clock)} {
  spdlog::info("Signing service ready: {}-of-{} quorum, resubmission {}",
               options_.quorum.threshold, options_.quorum.authorizers.size(),
               to_string(options_.resubmission));
}

std::optional<signing_request_t> service::get(
    const hash32_t& request_id) const {
  return storage_.get<signing_request_t>(
      encoder_, key::make_signing_request_key(request_id));
}

std::optional<signing_request_t> service::find_by_job(
    const hash32_t& job_id) const {
  auto latest = std::optional<signing_request_t>{};
  for (const auto& entry : storage_.list_by_prefix(
           key::make_prefix_key(key::kSigningRequestPrefix))) {
    auto request = encoder_.decode<signing_request_t>(entry.second);
    if (request.job_id != job_id) {
      continue;
    }
    if (!latest || request.created_at >= latest->created_at) {
      latest = std::move(request);
    }
  }
  return latest;
}

std::optional<publication_record_t> service::publication(
    const hash32_t& artifact_digest) const {
  return storage_.get<publication_record_t>(
      encoder_, key::make_publication_key(artifact_digest));
}

void service::commit(const signing_request_t& request,
                     const audit_event_type_t type,
                     const audit_severity_t severity,
                     std::string message,
                     warden::storage::write_batch_t batch) {
  batch.puts.emplace_back(key::make_signing_request_key(request.request_id),
                          encoder_.encode(request));
  audit_.append(audit_event_t{.type = type,
                              .entity_kind = entity_kind_t::signing_request,
                              .entity_id = request.request_id,
                              .severity = severity,
                              .message = std::move(message),
                              .payload = encoder_.encode(
                                  request.artifact_digest)},
                std::move(batch));
}

void service::close(signing_request_t& request,
                    signing_state_t state,
                    const audit_event_type_t type,
                    const audit_severity_t severity,
                    std::string message) {
  request.state = std::move(state);
  auto batch = warden::storage::write_batch_t{};
  batch.deletes.push_back(key::make_signing_open_key(request.artifact_digest));
  commit(request, type, severity, std::move(message), std::move(batch));
}

void service::reject_vote(const signing_request_t& request,
                          const authorization_record_t& vote,
                          const error_code_t code) {
  auto message = "vote from " + to_string(vote.authorizer) + " rejected: " +
                 std::string{to_string(code)};
  spdlog::error("Signing request {}: {}", to_hex(request.request_id), message);
  audit_.append(audit_event_t{
      .type = audit_event_type_t::authorization_rejected,
      .entity_kind = entity_kind_t::signing_request,
      .entity_id = request.request_id,
      .severity = code == error_code_t::authorization_mismatch
                      ? audit_severity_t::error
                      : audit_severity_t::warning,
      .message = std::move(message),
      .payload = encoder_.encode(vote.bound_digest)});
}

std::vector<authorization_record_t> service::fresh_approvals(
    const signing_request_t& request,
    const timestamp_milliseconds_t now) const {
  auto out = std::vector<authorization_record_t>{};
  for (const auto& vote : request.authorizations) {
    if (vote.decision == authorization_decision_t::approve &&
        vote.authorized_at <= now &&
        now - vote.authorized_at <= options_.quorum.vote_ttl_ms) {
      out.push_back(vote);
    }
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& lhs, const auto& rhs) {
    return lhs.authorized_at > rhs.authorized_at;
  });
  return out;
}

outcome<signing_request_t> service::open_request(
    const verification_decision_t& decision,
    const hash32_t& key_id,
    const std::string& app_id,
    const std::optional<hash32_t>& resubmitted_from) {
  if (decision.outcome != verification_outcome_t::consensus ||
      !decision.winning_digest) {
    return make_error<signing_request_t>(
        error_code_t::consensus_required,
        "decision is " + std::string{to_string(decision.outcome)});
  }
  const auto& digest = *decision.winning_digest;
  if (storage_.contains(key::make_signing_open_key(digest))) {
    return make_error<signing_request_t>(
        error_code_t::request_outstanding,
        "artifact already has an open signing request");
  }
  if (app_id.empty()) {
    return make_error<signing_request_t>(error_code_t::invalid_request,
                                         "application id required");
  }
  if (!keys_.get(key_id)) {
    return make_error<signing_request_t>(error_code_t::key_missing,
                                         "unknown signing key");
  }
  if (!keys_.usable(key_id)) {
    return make_error<signing_request_t>(error_code_t::key_revoked,
                                         "signing key is revoked");
  }

  auto now = clock_();
  auto request = signing_request_t{};
  request.request_id = warden::blake3::hash(
      kSigningRequestDomain,
      encoder_.encode(std::tuple{decision.decision_id, key_id, app_id, now,
                                 resubmitted_from}));
  request.job_id = decision.job_id;
  request.decision_id = decision.decision_id;
  request.artifact_digest = digest;
  request.key_id = key_id;
  request.app_id = app_id;
  request.threshold = options_.quorum.threshold;
  request.created_at = now;
  request.state = awaiting_quorum_t{.deadline = now + options_.request_ttl_ms};
  request.resubmitted_from = resubmitted_from;

  auto batch = warden::storage::write_batch_t{};
  batch.puts.emplace_back(key::make_signing_open_key(digest),
                          encoder_.encode(request.request_id));
  if (resubmitted_from) {
    commit(request, audit_event_type_t::request_resubmitted,
           audit_severity_t::info,
           "resubmitted from " + to_hex(*resubmitted_from), std::move(batch));
  } else {
    commit(request, audit_event_type_t::signing_requested,
           audit_severity_t::info,
           "awaiting " + std::to_string(request.threshold) + " approvals",
           std::move(batch));
  }
  spdlog::info("Signing request {} opened for artifact {}",
               to_hex(request.request_id), to_hex(digest));
  return make_ok(request);
}

outcome<signing_request_t> service::create(
    const verification_decision_t& decision,
    const hash32_t& key_id,
    const std::string& app_id) {
  auto lock = std::scoped_lock{mutex_};
  return open_request(decision, key_id, app_id, std::nullopt);
}

outcome<signing_request_t> service::authorize(
    const authorization_record_t& vote) {
  {
    auto lock = std::scoped_lock{mutex_};
    auto request = get(vote.request_id);
    if (!request) {
      return make_error<signing_request_t>(error_code_t::not_found,
                                           "unknown signing request");
    }

    const auto* awaiting = std::get_if<awaiting_quorum_t>(&request->state);
    if (awaiting == nullptr) {
      return with_request(error_code_t::request_finalized,
                          "request is " + std::string{to_string(request->state)},
                          *request);
    }

    auto now = clock_();
    if (now > awaiting->deadline) {
      close(*request, expired_t{.expired_at = now, .reason = "deadline passed"},
            audit_event_type_t::request_expired, audit_severity_t::warning,
            "expired awaiting quorum");
      return with_request(error_code_t::expired, "request expired", *request);
    }

    if (vote.action != quorum_action_t::sign_artifact ||
        vote.bound_digest != request->artifact_digest) {
      reject_vote(*request, vote, error_code_t::authorization_mismatch);
      return with_request(error_code_t::authorization_mismatch,
                          "vote is not bound to this artifact", *request);
    }
    if (auto code =
            warden::keys::check_authorization(vote, options_.quorum, now);
        code != error_code_t::ok) {
      reject_vote(*request, vote, code);
      return with_request(code, "vote rejected", *request);
    }
    // a valid deny always ends the request, even from an earlier approver
    if (vote.decision == authorization_decision_t::deny) {
      request->authorizations.push_back(vote);
      close(*request, denied_t{.denied_by = vote.authorizer, .denied_at = now},
            audit_event_type_t::request_denied, audit_severity_t::warning,
            "denied by " + to_string(vote.authorizer));
      return make_ok(*request);
    }

    auto seen = std::any_of(
        request->authorizations.begin(), request->authorizations.end(),
        [&](const auto& recorded) { return recorded.authorizer == vote.authorizer; });
    if (seen) {
      spdlog::warn("Duplicate vote from {} on request {}",
                   to_string(vote.authorizer), to_hex(request->request_id));
      return with_request(error_code_t::duplicate_authorization,
                          "authorizer already voted", *request);
    }

    request->authorizations.push_back(vote);

    auto approvals = fresh_approvals(*request, now).size();
    if (approvals < request->threshold) {
      commit(*request, audit_event_type_t::authorization_recorded,
             audit_severity_t::info,
             "approval " + std::to_string(approvals) + " of " +
                 std::to_string(request->threshold) + " from " +
                 to_string(vote.authorizer));
      return make_ok(*request);
    }

    request->state = authorized_t{.authorized_at = now, .last_failure = 0};
    commit(*request, audit_event_type_t::quorum_reached, audit_severity_t::info,
           "quorum reached with " + std::to_string(approvals) + " approvals");
    signing_.insert(request->request_id);
  }
  return execute_signing(vote.request_id);
}

outcome<signing_request_t> service::execute_signing(
    const hash32_t& request_id) {
  auto request = std::optional<signing_request_t>{};
  {
    auto lock = std::scoped_lock{mutex_};
    request = get(request_id);
  }
  if (!request) {
    warden::common::critical("signing request vanished while authorized");
  }

  auto proof = quorum_proof_t{};
  proof.action = quorum_action_t::sign_artifact;
  proof.request_id = request_id;
  proof.subject = request->artifact_digest;
  proof.approvals = fresh_approvals(*request, clock_());
  if (proof.approvals.size() > request->threshold) {
    proof.approvals.resize(request->threshold);
  }

  auto signature =
      keys_.sign(request->key_id, request->artifact_digest, proof);

  auto lock = std::scoped_lock{mutex_};
  signing_.erase(request_id);
  request = get(request_id);
  auto* authorized = request ? std::get_if<authorized_t>(&request->state)
                             : nullptr;
  if (authorized == nullptr) {
    warden::common::critical("signing request left Authorized while signing");
  }

  if (!signature.ok()) {
    authorized->last_failure = static_cast<uint32_t>(signature.code);
    commit(*request, audit_event_type_t::signing_failed,
           audit_severity_t::error,
           "signing failed closed: " + std::string{to_string(signature.code)});
    return with_request(signature.code, signature.log, *request);
  }

  auto now = clock_();
  request->state = signed_t{.signature = *signature.value, .signed_at = now};

  auto record = publication_record_t{};
  record.artifact_digest = request->artifact_digest;
  record.job_id = request->job_id;
  record.request_id = request->request_id;
  record.app_id = request->app_id;
  record.key_id = request->key_id;
  record.signature = *signature.value;
  record.signed_at = now;

  auto batch = warden::storage::write_batch_t{};
  batch.puts.emplace_back(key::make_publication_key(record.artifact_digest),
                          encoder_.encode(record));
  batch.deletes.push_back(key::make_signing_open_key(record.artifact_digest));
  commit(*request, audit_event_type_t::artifact_signed, audit_severity_t::info,
         "artifact signed for " + request->app_id, std::move(batch));
  spdlog::info("Artifact {} signed under request {}",
               to_hex(record.artifact_digest), to_hex(request_id));
  return make_ok(*request);
}

std::vector<hash32_t> service::expire_overdue() {
  auto lock = std::scoped_lock{mutex_};
  auto now = clock_();
  auto expired = std::vector<hash32_t>{};
  for (const auto& entry : storage_.list_by_prefix(
           key::make_prefix_key(key::kSigningOpenPrefix))) {
    auto request = get(encoder_.decode<hash32_t>(entry.second));
    if (!request) {
      continue;
    }
    const auto* awaiting = std::get_if<awaiting_quorum_t>(&request->state);
    if (awaiting == nullptr || now <= awaiting->deadline) {
      continue;
    }
    close(*request, expired_t{.expired_at = now, .reason = "deadline passed"},
          audit_event_type_t::request_expired, audit_severity_t::warning,
          "expired awaiting quorum");
    expired.push_back(request->request_id);
  }
  if (!expired.empty()) {
    spdlog::warn("Expired {} signing request(s)", expired.size());
  }
  return expired;
}

outcome<signing_request_t> service::abandon(const hash32_t& request_id,
                                            const std::string& reason) {
  auto lock = std::scoped_lock{mutex_};
  auto request = get(request_id);
  if (!request) {
    return make_error<signing_request_t>(error_code_t::not_found,
                                         "unknown signing request");
  }
  if (signing_.contains(request_id)) {
    return with_request(error_code_t::request_outstanding,
                        "signing is in progress", *request);
  }
  if (!std::holds_alternative<awaiting_quorum_t>(request->state) &&
      !std::holds_alternative<authorized_t>(request->state)) {
    return with_request(error_code_t::request_finalized,
                        "request is " + std::string{to_string(request->state)},
                        *request);
  }
  close(*request, expired_t{.expired_at = clock_(), .reason = reason},
        audit_event_type_t::request_abandoned, audit_severity_t::warning,
        "abandoned: " + reason);
  return make_ok(*request);
}

outcome<signing_request_t> service::resubmit(const hash32_t& request_id) {
  auto lock = std::scoped_lock{mutex_};
  if (options_.resubmission != resubmission_policy_t::reuse_decision) {
    return make_error<signing_request_t>(
        error_code_t::resubmission_requires_rebuild,
        "expired requests require a new build and decision");
  }
  auto request = get(request_id);
  if (!request) {
    return make_error<signing_request_t>(error_code_t::not_found,
                                         "unknown signing request");
  }
  if (!std::holds_alternative<expired_t>(request->state)) {
    return with_request(error_code_t::invalid_request,
                        "only expired requests can be resubmitted", *request);
  }
  auto decision = storage_.get<verification_decision_t>(
      encoder_, key::make_decision_key(request->decision_id));
  if (!decision) {
    return with_request(error_code_t::not_found,
                        "verification decision missing", *request);
  }
  return open_request(*decision, request->key_id, request->app_id, request_id);
}

outcome<signing_request_t> service::retry_signing(const hash32_t& request_id) {
  {
    auto lock = std::scoped_lock{mutex_};
    auto request = get(request_id);
    if (!request) {
      return make_error<signing_request_t>(error_code_t::not_found,
                                           "unknown signing request");
    }
    if (signing_.contains(request_id)) {
      return with_request(error_code_t::request_outstanding,
                          "signing is in progress", *request);
    }
    if (!std::holds_alternative<authorized_t>(request->state)) {
      return with_request(error_code_t::request_finalized,
                          "request is " +
                              std::string{to_string(request->state)},
                          *request);
    }
    signing_.insert(request_id);
  }
  return execute_signing(request_id);
}

}  // namespace warden::signing
