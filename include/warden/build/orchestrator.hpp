#pragma once

#include <warden/audit/log.hpp>
#include <warden/build/artifact_store.hpp>
#include <warden/build/executor.hpp>
#include <warden/build/sandbox.hpp>
#include <warden/schema/build_job.hpp>
#include <warden/schema/builder_result.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/outcome.hpp>
#include <warden/schema/verification_decision.hpp>
#include <warden/storage/rocksdb/storage.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace warden::build {

struct orchestrator_options final {
  std::vector<std::string> builders;
  warden::schema::duration_milliseconds_t attempt_timeout_ms{600000};
  uint32_t retry_budget{1};
  // 0 derives the deadline from the attempt timeout and retry budget
  warden::schema::duration_milliseconds_t job_deadline_ms{0};
  bool require_signed_sources{true};
  std::vector<warden::schema::signer_id_t> trusted_source_signers;
};

/// Invoked once per job, from the job's worker thread, after its terminal
/// state is durable.
using job_completion_callback_t = std::function<void(
    const warden::schema::job_status_t& status,
    const std::optional<warden::schema::verification_decision_t>& decision)>;

/// Accepts build jobs, fans each out to `n` isolated builders, enforces
/// attempt timeouts, retries and the job deadline, then hands the results to
/// the verification engine.
class orchestrator final {
 public:
  orchestrator(warden::schema::encoding::scale_encoder_t& encoder,
               warden::storage::rocksdb_storage_t& storage,
               warden::audit::log& audit,
               sandbox_pool& sandboxes,
               artifact_store& artifacts,
               build_executor_t executor,
               orchestrator_options options,
               warden::schema::time_source_t clock);
  ~orchestrator();

  orchestrator(const orchestrator&) = delete;
  orchestrator& operator=(const orchestrator&) = delete;

  void set_completion_callback(job_completion_callback_t callback);

  /// Returns the job id. On source verification failure the job is recorded
  /// as Rejected and the id is returned alongside the error code.
  warden::schema::outcome<warden::schema::hash32_t> submit(
      const warden::schema::build_job_t& job);

  std::optional<warden::schema::job_status_t> status(
      const warden::schema::hash32_t& job_id) const;

  /// Block until the job is terminal or the timeout elapses.
  std::optional<warden::schema::job_status_t> wait(
      const warden::schema::hash32_t& job_id,
      std::chrono::milliseconds timeout) const;

  /// Abort a job before consensus. In-flight sandboxes are torn down.
  warden::schema::status_t cancel(const warden::schema::hash32_t& job_id);

  std::optional<warden::schema::build_job_t> job(
      const warden::schema::hash32_t& job_id) const;
  std::vector<warden::schema::builder_result_t> results(
      const warden::schema::hash32_t& job_id) const;
  std::optional<warden::schema::verification_decision_t> decision(
      const warden::schema::hash32_t& job_id) const;
  std::optional<warden::schema::bytes_t> read_artifact(
      const warden::schema::hash32_t& digest) const;

 private:
  struct job_runtime final {
    std::mutex mutex;
    std::atomic<bool> cancelled{false};
    std::atomic<bool> deadline_passed{false};
    std::atomic<bool> finished{false};
    bool finalized{false};
    std::thread worker;
  };

  warden::schema::status_t validate(
      const warden::schema::build_job_t& job) const;
  void run_job(warden::schema::hash32_t job_id,
               warden::schema::build_job_t job,
               job_runtime& runtime);
  void run_builder(const warden::schema::hash32_t& job_id,
                   const warden::schema::build_job_t& job,
                   uint32_t builder_index,
                   std::chrono::steady_clock::time_point job_deadline,
                   job_runtime& runtime);
  warden::schema::builder_result_t run_attempt(
      const warden::schema::hash32_t& job_id,
      const warden::schema::build_job_t& job,
      const std::string& builder_id,
      uint32_t attempt,
      std::chrono::steady_clock::time_point job_deadline,
      job_runtime& runtime);
  void record_result(const warden::schema::builder_result_t& result,
                     uint32_t builder_index,
                     job_runtime& runtime);
  void finalize(const warden::schema::hash32_t& job_id,
                const warden::schema::build_job_t& job,
                job_runtime& runtime);
  /// Persist `status` together with the audit entry describing it; the
  /// entry's sequence is added to `audit_refs`.
  warden::schema::job_status_t commit_status(
      warden::schema::job_status_t status,
      const warden::schema::audit_event_t& event,
      warden::storage::write_batch_t batch);
  std::chrono::milliseconds job_deadline() const;
  void reap_finished();

  mutable std::mutex mutex_;
  mutable std::condition_variable terminal_cv_;
  warden::schema::encoding::scale_encoder_t& encoder_;
  warden::storage::rocksdb_storage_t& storage_;
  warden::audit::log& audit_;
  sandbox_pool& sandboxes_;
  artifact_store& artifacts_;
  build_executor_t executor_;
  orchestrator_options options_;
  warden::schema::time_source_t clock_;
  job_completion_callback_t on_complete_;
  std::map<warden::schema::hash32_t, std::unique_ptr<job_runtime>> running_;
};

}  // namespace warden::build
