#include <warden/common/critical.hpp>
#include <warden/execution/engine.hpp>

#include <spdlog/spdlog.h>

#include <utility>

using namespace warden::schema;

namespace warden::execution {

engine::engine(encoding::scale_encoder_t& encoder,
               warden::storage::rocksdb_storage_t& storage,
               warden::build::build_executor_t executor,
               engine_options options,
               time_source_t clock)
    : encoder_{encoder},
      storage_{storage},
      audit_{encoder, storage, clock},
      sandboxes_{options.sandbox_root},
      artifacts_{options.artifact_dir},
      hsm_{std::move(options.hsm)},
      keys_{encoder, storage, audit_, hsm_, std::move(options.keys), clock},
      signing_{encoder, storage, audit_, keys_, std::move(options.signing),
               clock},
      suspension_{encoder, storage, audit_, std::move(options.suspension),
                  clock},
      orchestrator_{encoder,     storage,
                    audit_,      sandboxes_,
                    artifacts_,  std::move(executor),
                    std::move(options.build), clock} {
  orchestrator_.set_completion_callback(
      [this](const job_status_t& status,
             const std::optional<verification_decision_t>& decision) {
        on_job_complete(status, decision);
      });
}

void engine::on_job_complete(
    const job_status_t& status,
    const std::optional<verification_decision_t>& decision) {
  if (status.state != job_state_t::verified || !decision ||
      decision->outcome != verification_outcome_t::consensus) {
    spdlog::info("Job {} finished {} ({}); nothing to sign",
                 to_hex(status.job_id), to_string(status.state),
                 to_string(status.reason));
    return;
  }

  auto job = orchestrator_.job(status.job_id);
  if (!job) {
    warden::common::critical("verified job has no stored build job");
  }

  auto key = keys_.find_signing_key(job->app_id);
  if (!key) {
    spdlog::error("No usable signing key for application '{}'", job->app_id);
    audit_.append(audit_event_t{
        .type = audit_event_type_t::signing_failed,
        .entity_kind = entity_kind_t::build_job,
        .entity_id = status.job_id,
        .severity = audit_severity_t::error,
        .message = "no usable signing key for " + job->app_id,
        .payload = encoder_.encode(decision->decision_id)});
    return;
  }

  auto request = signing_.create(*decision, key->key_id, job->app_id);
  if (!request.ok()) {
    spdlog::error("Signing request for job {} not created: {} ({})",
                  to_hex(status.job_id), to_string(request.code), request.log);
    audit_.append(audit_event_t{
        .type = audit_event_type_t::signing_failed,
        .entity_kind = entity_kind_t::build_job,
        .entity_id = status.job_id,
        .severity = audit_severity_t::error,
        .message = "signing request not created: " +
                   std::string{to_string(request.code)} + " (" + request.log +
                   ")",
        .payload = encoder_.encode(decision->decision_id)});
  }
}

outcome<hash32_t> engine::submit_build_job(const build_job_t& job) {
  return orchestrator_.submit(job);
}

std::optional<build_job_view> engine::build_job(const hash32_t& job_id) const {
  auto status = orchestrator_.status(job_id);
  if (!status) {
    return std::nullopt;
  }
  auto view = build_job_view{};
  view.status = std::move(*status);
  view.decision = orchestrator_.decision(job_id);
  view.signing_request = signing_.find_by_job(job_id);
  return view;
}

status_t engine::cancel_build_job(const hash32_t& job_id) {
  return orchestrator_.cancel(job_id);
}

outcome<signing_request_t> engine::authorize(
    const hash32_t& job_id,
    const authorization_record_t& vote) {
  auto current = signing_.find_by_job(job_id);
  if (!current) {
    return make_error<signing_request_t>(error_code_t::not_found,
                                         "job has no signing request");
  }
  if (current->request_id != vote.request_id) {
    spdlog::error("Vote for job {} names request {} instead of {}",
                  to_hex(job_id), to_hex(vote.request_id),
                  to_hex(current->request_id));
    auto result = make_error<signing_request_t>(
        error_code_t::authorization_mismatch,
        "vote is bound to a different signing request");
    result.value = *current;
    return result;
  }
  return signing_.authorize(vote);
}

std::vector<audit_entry_t> engine::audit_range(const uint64_t from,
                                               const uint64_t to) const {
  return audit_.range(from, to);
}

warden::audit::chain_report engine::verify_audit(const uint64_t from,
                                                 const uint64_t to) const {
  return audit_.verify_chain(from, to);
}

warden::audit::chain_report engine::verify_audit() const {
  return audit_.verify_chain();
}

bool engine::is_suspended(const hash32_t& artifact_digest) const {
  return suspension_.is_suspended(artifact_digest);
}

void engine::sweep() {
  signing_.expire_overdue();
}

}  // namespace warden::execution
