#include <warden/rpc/convert.hpp>
#include <warden/rpc/server.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

using namespace warden::rpc;
using namespace warden::schema;

namespace {

// entries returned by one GetAudit call
inline constexpr auto kMaxAuditPage = uint64_t{1000};

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

template <typename Response>
grpc::ServerUnaryReactor* finish_error(grpc::CallbackServerContext* context,
                                       Response* response,
                                       const error_code_t code,
                                       const std::string& log) {
  set_status(code, log, response->mutable_status());
  return finish_ok(context);
}

}  // namespace

listener::listener(warden::execution::engine& engine) : engine_{engine} {}

grpc::ServerUnaryReactor* listener::SubmitBuildJob(
    grpc::CallbackServerContext* context,
    const warden::v1::SubmitBuildJobRequest* request,
    warden::v1::SubmitBuildJobResponse* response) {
  auto job = from_proto(*request);
  if (!job.ok()) {
    return finish_error(context, response, job.code, job.log);
  }
  auto submitted = engine_.submit_build_job(*job.value);
  set_status(submitted.code, submitted.log, response->mutable_status());
  if (submitted.value) {
    response->set_job_id(make_string(*submitted.value));
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetBuildJob(
    grpc::CallbackServerContext* context,
    const warden::v1::GetBuildJobRequest* request,
    warden::v1::GetBuildJobResponse* response) {
  auto job_id = try_hash32_from_bytes(request->job_id());
  if (!job_id) {
    return finish_error(context, response, error_code_t::invalid_request,
                        "job id must be 32 bytes");
  }
  auto view = engine_.build_job(*job_id);
  if (!view) {
    return finish_error(context, response, error_code_t::not_found,
                        "unknown job");
  }
  set_status(error_code_t::ok, {}, response->mutable_status());
  response->set_state(std::string{to_string(view->status.state)});
  response->set_reason(std::string{to_string(view->status.reason)});
  response->set_detail(view->status.detail);
  response->set_submitted_at(view->status.submitted_at);
  response->set_finished_at(view->status.finished_at.value_or(0));
  for (auto sequence : view->status.audit_refs) {
    response->add_audit_refs(sequence);
  }
  if (view->decision) {
    to_proto(*view->decision, response->mutable_verification_decision());
  }
  if (view->signing_request) {
    to_proto(*view->signing_request, response->mutable_signing_request());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CancelBuildJob(
    grpc::CallbackServerContext* context,
    const warden::v1::CancelBuildJobRequest* request,
    warden::v1::CancelBuildJobResponse* response) {
  auto job_id = try_hash32_from_bytes(request->job_id());
  if (!job_id) {
    return finish_error(context, response, error_code_t::invalid_request,
                        "job id must be 32 bytes");
  }
  auto cancelled = engine_.cancel_build_job(*job_id);
  set_status(cancelled.code, cancelled.log, response->mutable_status());
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Authorize(
    grpc::CallbackServerContext* context,
    const warden::v1::AuthorizeRequest* request,
    warden::v1::AuthorizeResponse* response) {
  auto job_id = try_hash32_from_bytes(request->job_id());
  if (!job_id) {
    return finish_error(context, response, error_code_t::invalid_request,
                        "job id must be 32 bytes");
  }
  auto vote = from_proto(*request);
  if (!vote.ok()) {
    return finish_error(context, response, vote.code, vote.log);
  }
  auto result = engine_.authorize(*job_id, *vote.value);
  set_status(result.code, result.log, response->mutable_status());
  if (result.value) {
    response->set_quorum_state(
        std::string{to_string(quorum_state_of(result.value->state))});
    to_proto(*result.value, response->mutable_signing_request());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetAudit(
    grpc::CallbackServerContext* context,
    const warden::v1::GetAuditRequest* request,
    warden::v1::GetAuditResponse* response) {
  auto from = request->from_sequence();
  auto to = request->to_sequence();
  if (from > to) {
    return finish_error(context, response, error_code_t::invalid_request,
                        "from_sequence exceeds to_sequence");
  }
  to = std::min(to, from + kMaxAuditPage - 1);
  for (const auto& entry : engine_.audit_range(from, to)) {
    to_proto(entry, response->add_entries());
  }
  set_status(error_code_t::ok, {}, response->mutable_status());
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::VerifyAudit(
    grpc::CallbackServerContext* context,
    const warden::v1::VerifyAuditRequest* request,
    warden::v1::VerifyAuditResponse* response) {
  if (request->from_sequence() > request->to_sequence()) {
    return finish_error(context, response, error_code_t::invalid_request,
                        "from_sequence exceeds to_sequence");
  }
  if (request->from_sequence() > engine_.audit().tail_sequence()) {
    return finish_error(context, response, error_code_t::invalid_request,
                        "from_sequence is past the audit tail");
  }
  auto report =
      engine_.verify_audit(request->from_sequence(), request->to_sequence());
  if (!report.intact) {
    spdlog::critical("Audit chain verification failed at {}: {}",
                     report.first_broken_sequence.value_or(0), report.reason);
  }
  set_status(report.intact ? error_code_t::ok : error_code_t::audit_chain_broken,
             report.reason, response->mutable_status());
  response->set_intact(report.intact);
  response->set_entries_checked(report.entries_checked);
  response->set_first_broken_sequence(report.first_broken_sequence.value_or(0));
  response->set_reason(report.reason);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Suspend(
    grpc::CallbackServerContext* context,
    const warden::v1::SuspensionRequest* request,
    warden::v1::SuspensionResponse* response) {
  auto token = from_proto(request->authority_token());
  if (!token.ok()) {
    return finish_error(context, response, token.code, token.log);
  }
  auto& suspension = engine_.suspension();
  auto result = outcome<suspension_record_t>{};
  if (!request->artifact_id().empty()) {
    auto digest = try_hash32_from_bytes(request->artifact_id());
    if (!digest) {
      return finish_error(context, response, error_code_t::invalid_request,
                          "artifact id must be 32 bytes");
    }
    result = suspension.suspend(*digest, request->reason(), *token.value);
  } else if (!request->app_id().empty()) {
    result = suspension.suspend_application(request->app_id(),
                                            request->reason(), *token.value);
  } else {
    return finish_error(context, response, error_code_t::invalid_request,
                        "artifact id or application id required");
  }
  set_status(result.code, result.log, response->mutable_status());
  if (result.value) {
    to_proto(*result.value, response->mutable_suspension_record());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Unsuspend(
    grpc::CallbackServerContext* context,
    const warden::v1::SuspensionRequest* request,
    warden::v1::SuspensionResponse* response) {
  auto token = from_proto(request->authority_token());
  if (!token.ok()) {
    return finish_error(context, response, token.code, token.log);
  }
  auto& suspension = engine_.suspension();
  auto result = outcome<suspension_record_t>{};
  if (!request->artifact_id().empty()) {
    auto digest = try_hash32_from_bytes(request->artifact_id());
    if (!digest) {
      return finish_error(context, response, error_code_t::invalid_request,
                          "artifact id must be 32 bytes");
    }
    result = suspension.unsuspend(*digest, request->reason(), *token.value);
  } else if (!request->app_id().empty()) {
    result = suspension.unsuspend_application(request->app_id(),
                                              request->reason(), *token.value);
  } else {
    return finish_error(context, response, error_code_t::invalid_request,
                        "artifact id or application id required");
  }
  set_status(result.code, result.log, response->mutable_status());
  if (result.value) {
    to_proto(*result.value, response->mutable_suspension_record());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::IsSuspended(
    grpc::CallbackServerContext* context,
    const warden::v1::IsSuspendedRequest* request,
    warden::v1::IsSuspendedResponse* response) {
  auto digest = try_hash32_from_bytes(request->artifact_id());
  // malformed ids read as suspended so publishers fail closed
  response->set_suspended(!digest || engine_.is_suspended(*digest));
  return finish_ok(context);
}
