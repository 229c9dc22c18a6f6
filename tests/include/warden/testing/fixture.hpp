#pragma once

#include <warden/audit/log.hpp>
#include <warden/keys/hsm.hpp>
#include <warden/keys/manager.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/key/keyspace.hpp>
#include <warden/schema/verification_decision.hpp>
#include <warden/signing/service.hpp>
#include <warden/storage/rocksdb/storage.hpp>
#include <warden/testing/common.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace warden::testing {

/// Database, audit log and clock shared by component tests.
class store_fixture {
 public:
  explicit store_fixture(const std::string_view prefix)
      : dir_{prefix},
        encoder_{},
        storage_{warden::storage::make_storage<
            warden::storage::rocksdb_storage_tag>(
            (dir_.path() / "db").string())},
        clock_{},
        audit_{encoder_, storage_, clock_.source()} {}

  store_fixture(const store_fixture&) = delete;
  store_fixture& operator=(const store_fixture&) = delete;

  const std::filesystem::path& dir() const { return dir_.path(); }
  warden::schema::encoding::scale_encoder_t& encoder() { return encoder_; }
  warden::storage::rocksdb_storage_t& storage() { return storage_; }
  manual_clock& clock() { return clock_; }
  warden::audit::log& audit() { return audit_; }

 private:
  scoped_dir dir_;
  warden::schema::encoding::scale_encoder_t encoder_;
  warden::storage::rocksdb_storage_t storage_;
  manual_clock clock_;
  warden::audit::log audit_;
};

/// Key hierarchy plus signing service with a 2-of-3 publication quorum and
/// a 3-member ceremony.
class signing_fixture : public store_fixture {
 public:
  static constexpr auto kVoteTtlMs = warden::schema::duration_milliseconds_t{
      60 * 60 * 1000};
  static constexpr auto kRequestTtlMs =
      warden::schema::duration_milliseconds_t{24 * 60 * 60 * 1000};

  explicit signing_fixture(
      const std::string_view prefix,
      const warden::schema::resubmission_policy_t resubmission =
          warden::schema::resubmission_policy_t::rebuild)
      : store_fixture{prefix},
        authorizers_{make_voters(3)},
        participants_{make_voters(3)},
        hsm_{warden::keys::hsm_options{}},
        keys_{encoder(),
              storage(),
              audit(),
              hsm_,
              warden::keys::manager_options{
                  .signing_quorum = policy(),
                  .ceremony_participants = signers_of(participants_),
                  .slot_timeout_ms = 1000},
              clock().source()},
        signing_{encoder(),
                 storage(),
                 audit(),
                 keys_,
                 warden::signing::service_options{
                     .quorum = policy(),
                     .request_ttl_ms = kRequestTtlMs,
                     .resubmission = resubmission},
                 clock().source()} {}

  warden::keys::quorum_policy_t policy() const {
    return warden::keys::quorum_policy_t{
        .authorizers = signers_of(authorizers_),
        .threshold = 2,
        .vote_ttl_ms = kVoteTtlMs};
  }

  const std::vector<voter>& authorizers() const { return authorizers_; }
  const std::vector<voter>& participants() const { return participants_; }
  warden::keys::hsm<warden::keys::openssl_hsm_tag>& hsm() { return hsm_; }
  warden::keys::manager& keys() { return keys_; }
  warden::signing::service& signing() { return signing_; }

  warden::schema::outcome<warden::schema::key_record_t> ceremony(
      const warden::schema::key_role_t role,
      const std::optional<warden::schema::hash32_t>& parent,
      const std::optional<std::string>& app_id) {
    auto subject = warden::keys::manager::ceremony_subject(role, parent, app_id);
    auto proof = make_proof(warden::schema::quorum_action_t::create_key,
                            subject, subject, participants_, clock().now());
    return keys_.create_key(role, parent, app_id, proof);
  }

  /// Root -> repository -> app key for `app_id`. Returns the app key.
  warden::schema::key_record_t make_hierarchy(const std::string& app_id) {
    auto root = ceremony(warden::schema::key_role_t::root, std::nullopt,
                         std::nullopt);
    if (!root.ok()) {
      warden::common::critical("root ceremony failed");
    }
    repository_ = ceremony(warden::schema::key_role_t::repository_signing,
                           root.value->key_id, std::nullopt)
                       .value;
    if (!repository_) {
      warden::common::critical("repository ceremony failed");
    }
    auto app = ceremony(warden::schema::key_role_t::app_signing,
                        repository_->key_id, app_id);
    if (!app.ok()) {
      warden::common::critical("app ceremony failed");
    }
    root_ = root.value;
    return *app.value;
  }

  const std::optional<warden::schema::key_record_t>& root_key() const {
    return root_;
  }
  const std::optional<warden::schema::key_record_t>& repository_key() const {
    return repository_;
  }

  /// A consensus decision as the verification engine would store it.
  warden::schema::verification_decision_t store_consensus(
      const warden::schema::hash32_t& job_id,
      const warden::schema::hash32_t& digest) {
    auto decision = warden::schema::verification_decision_t{};
    decision.decision_id = make_hash(static_cast<uint8_t>(job_id[0] + 100));
    decision.job_id = job_id;
    decision.outcome = warden::schema::verification_outcome_t::consensus;
    decision.winning_digest = digest;
    decision.n = 3;
    decision.k = 3;
    decision.decided_at = clock().now();
    storage().put(encoder(),
                  warden::schema::key::make_decision_key(decision.decision_id),
                  decision);
    return decision;
  }

 private:
  std::vector<voter> authorizers_;
  std::vector<voter> participants_;
  warden::keys::hsm<warden::keys::openssl_hsm_tag> hsm_;
  warden::keys::manager keys_;
  warden::signing::service signing_;
  std::optional<warden::schema::key_record_t> root_;
  std::optional<warden::schema::key_record_t> repository_;
};

}  // namespace warden::testing
