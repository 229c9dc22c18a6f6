#pragma once

#include <warden/audit/log.hpp>
#include <warden/build/artifact_store.hpp>
#include <warden/build/executor.hpp>
#include <warden/build/orchestrator.hpp>
#include <warden/build/sandbox.hpp>
#include <warden/keys/hsm.hpp>
#include <warden/keys/manager.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/signing/service.hpp>
#include <warden/storage/rocksdb/storage.hpp>
#include <warden/suspension/controller.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

namespace warden::execution {

struct engine_options final {
  std::filesystem::path sandbox_root;
  std::filesystem::path artifact_dir;
  warden::build::orchestrator_options build;
  warden::keys::hsm_options hsm;
  warden::keys::manager_options keys;
  warden::signing::service_options signing;
  warden::suspension::controller_options suspension;
};

/// What `GET build-job/{id}` reports.
struct build_job_view final {
  warden::schema::job_status_t status;
  std::optional<warden::schema::verification_decision_t> decision;
  std::optional<warden::schema::signing_request_t> signing_request;
};

/// Composition root. Owns every component, routes verified builds into the
/// signing service and exposes the external operations.
class engine final {
 public:
  engine(warden::schema::encoding::scale_encoder_t& encoder,
         warden::storage::rocksdb_storage_t& storage,
         warden::build::build_executor_t executor,
         engine_options options,
         warden::schema::time_source_t clock);

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  warden::schema::outcome<warden::schema::hash32_t> submit_build_job(
      const warden::schema::build_job_t& job);
  std::optional<build_job_view> build_job(
      const warden::schema::hash32_t& job_id) const;
  warden::schema::status_t cancel_build_job(
      const warden::schema::hash32_t& job_id);

  /// `vote.request_id` must be the job's current signing request.
  warden::schema::outcome<warden::schema::signing_request_t> authorize(
      const warden::schema::hash32_t& job_id,
      const warden::schema::authorization_record_t& vote);

  std::vector<warden::schema::audit_entry_t> audit_range(uint64_t from,
                                                         uint64_t to) const;
  warden::audit::chain_report verify_audit(uint64_t from, uint64_t to) const;
  warden::audit::chain_report verify_audit() const;

  bool is_suspended(const warden::schema::hash32_t& artifact_digest) const;

  /// Periodic housekeeping: expires overdue signing requests.
  void sweep();

  warden::audit::log& audit() { return audit_; }
  warden::keys::hsm<warden::keys::openssl_hsm_tag>& hsm() { return hsm_; }
  warden::keys::manager& keys() { return keys_; }
  warden::signing::service& signing() { return signing_; }
  warden::suspension::controller& suspension() { return suspension_; }
  warden::build::orchestrator& orchestrator() { return orchestrator_; }
  const warden::build::artifact_store& artifacts() const { return artifacts_; }

 private:
  void on_job_complete(
      const warden::schema::job_status_t& status,
      const std::optional<warden::schema::verification_decision_t>& decision);

  warden::schema::encoding::scale_encoder_t& encoder_;
  warden::storage::rocksdb_storage_t& storage_;
  warden::audit::log audit_;
  warden::build::sandbox_pool sandboxes_;
  warden::build::artifact_store artifacts_;
  warden::keys::hsm<warden::keys::openssl_hsm_tag> hsm_;
  warden::keys::manager keys_;
  warden::signing::service signing_;
  warden::suspension::controller suspension_;
  // last: its worker threads stop before anything they call is destroyed
  warden::build::orchestrator orchestrator_;
};

}  // namespace warden::execution
