#pragma once

#include <warden/audit/log.hpp>
#include <warden/keys/manager.hpp>
#include <warden/keys/quorum.hpp>
#include <warden/schema/authorization_record.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/outcome.hpp>
#include <warden/schema/signing_request.hpp>
#include <warden/schema/verification_decision.hpp>
#include <warden/storage/rocksdb/storage.hpp>

#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace warden::signing {

inline constexpr auto kSigningRequestDomain =
    std::string_view{"warden.signing-request.v1"};

struct service_options final {
  warden::keys::quorum_policy_t quorum;
  warden::schema::duration_milliseconds_t request_ttl_ms{86400000};
  warden::schema::resubmission_policy_t resubmission{
      warden::schema::resubmission_policy_t::rebuild};
};

/// M-of-N authorization of consensus artifacts.
///
/// One open request per artifact digest. A Deny from any authorizer ends the
/// request; reaching the threshold hands a quorum proof to the key manager.
/// Every operation returns the request as it stands afterwards whenever the
/// request exists, including on failure.
class service final {
 public:
  service(warden::schema::encoding::scale_encoder_t& encoder,
          warden::storage::rocksdb_storage_t& storage,
          warden::audit::log& audit,
          warden::keys::manager& keys,
          service_options options,
          warden::schema::time_source_t clock);

  service(const service&) = delete;
  service& operator=(const service&) = delete;

  warden::schema::outcome<warden::schema::signing_request_t> create(
      const warden::schema::verification_decision_t& decision,
      const warden::schema::hash32_t& key_id,
      const std::string& app_id);

  warden::schema::outcome<warden::schema::signing_request_t> authorize(
      const warden::schema::authorization_record_t& vote);

  /// Moves every overdue AwaitingQuorum request to Expired. Returns the ids
  /// that expired.
  std::vector<warden::schema::hash32_t> expire_overdue();

  warden::schema::outcome<warden::schema::signing_request_t> abandon(
      const warden::schema::hash32_t& request_id,
      const std::string& reason);

  /// New request for an Expired one, reusing its consensus decision.
  warden::schema::outcome<warden::schema::signing_request_t> resubmit(
      const warden::schema::hash32_t& request_id);

  /// Re-run signing for an Authorized request whose signing failed closed.
  warden::schema::outcome<warden::schema::signing_request_t> retry_signing(
      const warden::schema::hash32_t& request_id);

  std::optional<warden::schema::signing_request_t> get(
      const warden::schema::hash32_t& request_id) const;
  /// Most recent request created for the job.
  std::optional<warden::schema::signing_request_t> find_by_job(
      const warden::schema::hash32_t& job_id) const;
  std::optional<warden::schema::publication_record_t> publication(
      const warden::schema::hash32_t& artifact_digest) const;

  const service_options& options() const { return options_; }

 private:
  warden::schema::outcome<warden::schema::signing_request_t> open_request(
      const warden::schema::verification_decision_t& decision,
      const warden::schema::hash32_t& key_id,
      const std::string& app_id,
      const std::optional<warden::schema::hash32_t>& resubmitted_from);
  void commit(const warden::schema::signing_request_t& request,
              warden::schema::audit_event_type_t type,
              warden::schema::audit_severity_t severity,
              std::string message,
              warden::storage::write_batch_t batch = {});
  void close(warden::schema::signing_request_t& request,
             warden::schema::signing_state_t state,
             warden::schema::audit_event_type_t type,
             warden::schema::audit_severity_t severity,
             std::string message);
  void reject_vote(const warden::schema::signing_request_t& request,
                   const warden::schema::authorization_record_t& vote,
                   warden::schema::error_code_t code);
  std::vector<warden::schema::authorization_record_t> fresh_approvals(
      const warden::schema::signing_request_t& request,
      warden::schema::timestamp_milliseconds_t now) const;
  warden::schema::outcome<warden::schema::signing_request_t> execute_signing(
      const warden::schema::hash32_t& request_id);

  mutable std::mutex mutex_;
  warden::schema::encoding::scale_encoder_t& encoder_;
  warden::storage::rocksdb_storage_t& storage_;
  warden::audit::log& audit_;
  warden::keys::manager& keys_;
  service_options options_;
  warden::schema::time_source_t clock_;
  // requests with a key manager call in flight
  std::set<warden::schema::hash32_t> signing_;
};

}  // namespace warden::signing
