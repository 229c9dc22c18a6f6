#pragma once

#include <warden/execution/engine.hpp>
#include <warden/v1/warden.grpc.pb.h>

namespace warden::rpc {

/// gRPC front end for the execution engine.
///
/// Every call completes with grpc::Status::OK; the outcome of the operation
/// travels in the response's `status` field so that callers always receive a
/// specific reason code.
struct listener final : public warden::v1::Warden::CallbackService {
  explicit listener(warden::execution::engine& engine);

  /// POST build-job
  virtual grpc::ServerUnaryReactor* SubmitBuildJob(
      grpc::CallbackServerContext* context,
      const warden::v1::SubmitBuildJobRequest* request,
      warden::v1::SubmitBuildJobResponse* response) override final;

  /// GET build-job/{jobId}
  virtual grpc::ServerUnaryReactor* GetBuildJob(
      grpc::CallbackServerContext* context,
      const warden::v1::GetBuildJobRequest* request,
      warden::v1::GetBuildJobResponse* response) override final;

  virtual grpc::ServerUnaryReactor* CancelBuildJob(
      grpc::CallbackServerContext* context,
      const warden::v1::CancelBuildJobRequest* request,
      warden::v1::CancelBuildJobResponse* response) override final;

  /// POST signing-request/{jobId}/authorize
  virtual grpc::ServerUnaryReactor* Authorize(
      grpc::CallbackServerContext* context,
      const warden::v1::AuthorizeRequest* request,
      warden::v1::AuthorizeResponse* response) override final;

  /// GET audit/{fromSeq}/{toSeq}
  virtual grpc::ServerUnaryReactor* GetAudit(
      grpc::CallbackServerContext* context,
      const warden::v1::GetAuditRequest* request,
      warden::v1::GetAuditResponse* response) override final;

  virtual grpc::ServerUnaryReactor* VerifyAudit(
      grpc::CallbackServerContext* context,
      const warden::v1::VerifyAuditRequest* request,
      warden::v1::VerifyAuditResponse* response) override final;

  /// POST suspension
  virtual grpc::ServerUnaryReactor* Suspend(
      grpc::CallbackServerContext* context,
      const warden::v1::SuspensionRequest* request,
      warden::v1::SuspensionResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Unsuspend(
      grpc::CallbackServerContext* context,
      const warden::v1::SuspensionRequest* request,
      warden::v1::SuspensionResponse* response) override final;

  virtual grpc::ServerUnaryReactor* IsSuspended(
      grpc::CallbackServerContext* context,
      const warden::v1::IsSuspendedRequest* request,
      warden::v1::IsSuspendedResponse* response) override final;

 private:
  warden::execution::engine& engine_;
};

}  // namespace warden::rpc
