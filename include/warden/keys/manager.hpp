#pragma once

#include <warden/audit/log.hpp>
#include <warden/keys/hsm.hpp>
#include <warden/keys/quorum.hpp>
#include <warden/schema/authorization_record.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/key_record.hpp>
#include <warden/schema/outcome.hpp>
#include <warden/storage/rocksdb/storage.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace warden::keys {

inline constexpr auto kKeyIdDomain = std::string_view{"warden.key.v1"};
inline constexpr auto kCeremonyDomain = std::string_view{"warden.ceremony.v1"};
inline constexpr auto kArtifactSignatureDomain =
    std::string_view{"warden.artifact-signature.v1"};

struct manager_options final {
  quorum_policy_t signing_quorum;
  std::vector<warden::schema::signer_id_t> ceremony_participants;
  // how long a caller waits for the per-key signing slot
  warden::schema::duration_milliseconds_t slot_timeout_ms{30000};
};

/// Key hierarchy: Root -> RepositorySigning -> AppSigning.
///
/// Records carry HSM handles and public keys only. Every mutation and every
/// signature is gated on a quorum proof.
class manager final {
 public:
  manager(warden::schema::encoding::scale_encoder_t& encoder,
          warden::storage::rocksdb_storage_t& storage,
          warden::audit::log& audit,
          hsm<openssl_hsm_tag>& hsm,
          manager_options options,
          warden::schema::time_source_t clock);

  manager(const manager&) = delete;
  manager& operator=(const manager&) = delete;

  /// Key ceremony. `proof` must carry an Approve from every ceremony
  /// participant for `ceremony_subject(role, parent_id, app_id)`.
  warden::schema::outcome<warden::schema::key_record_t> create_key(
      warden::schema::key_role_t role,
      const std::optional<warden::schema::hash32_t>& parent_id,
      const std::optional<std::string>& app_id,
      const warden::schema::quorum_proof_t& proof);

  /// Signs BLAKE3(artifact-signature domain, digest). `proof.request_id` must
  /// name a signing request for this key and digest.
  warden::schema::outcome<warden::schema::ed25519_signature_t> sign(
      const warden::schema::hash32_t& key_id,
      const warden::schema::hash32_t& digest,
      const warden::schema::quorum_proof_t& proof);

  /// Irreversible.
  warden::schema::outcome<warden::schema::key_record_t> revoke(
      const warden::schema::hash32_t& key_id,
      const warden::schema::quorum_proof_t& proof);

  std::optional<warden::schema::key_record_t> get(
      const warden::schema::hash32_t& key_id) const;
  std::vector<warden::schema::key_record_t> list() const;

  /// Active and every ancestor active.
  bool usable(const warden::schema::hash32_t& key_id) const;

  /// Active AppSigning key for `app_id`, otherwise the active
  /// RepositorySigning key.
  std::optional<warden::schema::key_record_t> find_signing_key(
      const std::string& app_id) const;

  /// Raw signature check against the stored public key. Revocation does not
  /// change the answer.
  bool verify_signature(const warden::schema::hash32_t& key_id,
                        const warden::schema::hash32_t& digest,
                        const warden::schema::ed25519_signature_t& signature) const;

  /// Whether the key (and its chain) was valid at `at`.
  bool valid_at(const warden::schema::hash32_t& key_id,
                warden::schema::timestamp_milliseconds_t at) const;

  static warden::schema::hash32_t ceremony_subject(
      warden::schema::key_role_t role,
      const std::optional<warden::schema::hash32_t>& parent_id,
      const std::optional<std::string>& app_id);
  static warden::schema::hash32_t signing_message(
      const warden::schema::hash32_t& digest);

 private:
  warden::schema::error_code_t check_parent(
      warden::schema::key_role_t role,
      const std::optional<warden::schema::hash32_t>& parent_id,
      const std::optional<std::string>& app_id) const;
  warden::schema::error_code_t check_chain(
      const warden::schema::key_record_t& record) const;
  bool request_targets(const warden::schema::hash32_t& request_id,
                       const warden::schema::hash32_t& key_id,
                       const warden::schema::hash32_t& digest) const;
  void record_security_event(warden::schema::audit_event_type_t type,
                             const warden::schema::hash32_t& entity_id,
                             const std::string& message);
  std::timed_mutex& slot(const warden::schema::hash32_t& key_id);

  mutable std::mutex mutex_;
  warden::schema::encoding::scale_encoder_t& encoder_;
  warden::storage::rocksdb_storage_t& storage_;
  warden::audit::log& audit_;
  hsm<openssl_hsm_tag>& hsm_;
  manager_options options_;
  warden::schema::time_source_t clock_;
  std::map<warden::schema::hash32_t, std::unique_ptr<std::timed_mutex>> slots_;
};

}  // namespace warden::keys
