#include <warden/blake3/hash.hpp>
#include <warden/crypto/verify.hpp>
#include <warden/keys/manager.hpp>
#include <warden/schema/key/keyspace.hpp>
#include <warden/schema/signing_request.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <tuple>
#include <utility>

using namespace warden::schema;

namespace warden::keys {

namespace {

// Root -> repository -> app, plus slack for a corrupted parent loop.
inline constexpr auto kMaxChainDepth = 8;

audit_event_t key_event(const audit_event_type_t type,
                        const hash32_t& key_id,
                        const audit_severity_t severity,
                        std::string message) {
  return audit_event_t{.type = type,
                       .entity_kind = entity_kind_t::key,
                       .entity_id = key_id,
                       .severity = severity,
                       .message = std::move(message),
                       .payload = {}};
}

}  // namespace

manager::manager(encoding::scale_encoder_t& encoder,
                 warden::storage::rocksdb_storage_t& storage,
                 warden::audit::log& audit,
                 hsm<openssl_hsm_tag>& hsm,
                 manager_options options,
                 time_source_t clock)
    : encoder_{encoder},
      storage_{storage},
      audit_{audit},
      hsm_{hsm},
      options_{std::move(options)},
      clock_{std::move(clock)} {}

hash32_t manager::ceremony_subject(const key_role_t role,
                                   const std::optional<hash32_t>& parent_id,
                                   const std::optional<std::string>& app_id) {
  auto encoder = encoding::scale_encoder_t{};
  return warden::blake3::hash(kCeremonyDomain,
                              encoder.encode(std::tuple{role, parent_id, app_id}));
}

hash32_t manager::signing_message(const hash32_t& digest) {
  return warden::blake3::hash(kArtifactSignatureDomain, digest);
}

void manager::record_security_event(const audit_event_type_t type,
                                    const hash32_t& entity_id,
                                    const std::string& message) {
  spdlog::error("Key manager security event {}: {}", to_string(type), message);
  audit_.append(
      key_event(type, entity_id, audit_severity_t::critical, message));
}

std::optional<key_record_t> manager::get(const hash32_t& key_id) const {
  return storage_.get<key_record_t>(encoder_, key::make_key_record_key(key_id));
}

std::vector<key_record_t> manager::list() const {
  auto out = std::vector<key_record_t>{};
  for (const auto& entry : storage_.list_by_prefix(
           key::make_prefix_key(key::kKeyRecordPrefix))) {
    out.push_back(encoder_.decode<key_record_t>(entry.second));
  }
  return out;
}

error_code_t manager::check_chain(const key_record_t& record) const {
  auto current = std::optional<key_record_t>{record};
  for (auto depth = 0; depth < kMaxChainDepth; ++depth) {
    if (current->status == key_status_t::revoked) {
      return error_code_t::key_revoked;
    }
    if (!current->parent_id) {
      return error_code_t::ok;
    }
    current = get(*current->parent_id);
    if (!current) {
      return error_code_t::key_missing;
    }
  }
  return error_code_t::key_hierarchy_violation;
}

bool manager::usable(const hash32_t& key_id) const {
  auto record = get(key_id);
  return record && check_chain(*record) == error_code_t::ok;
}

error_code_t manager::check_parent(
    const key_role_t role,
    const std::optional<hash32_t>& parent_id,
    const std::optional<std::string>& app_id) const {
  if (role == key_role_t::root) {
    if (parent_id || app_id) {
      return error_code_t::key_hierarchy_violation;
    }
    auto records = list();
    auto has_root =
        std::any_of(records.begin(), records.end(), [](const auto& record) {
          return record.role == key_role_t::root;
        });
    return has_root ? error_code_t::root_exists : error_code_t::ok;
  }

  if (!parent_id) {
    return error_code_t::key_hierarchy_violation;
  }
  auto parent = get(*parent_id);
  if (!parent) {
    return error_code_t::key_missing;
  }

  auto expected_parent = role == key_role_t::repository_signing
                             ? key_role_t::root
                             : key_role_t::repository_signing;
  if (parent->role != expected_parent) {
    return error_code_t::key_hierarchy_violation;
  }
  if (role == key_role_t::repository_signing && app_id) {
    return error_code_t::key_hierarchy_violation;
  }
  if (role == key_role_t::app_signing && (!app_id || app_id->empty())) {
    return error_code_t::key_hierarchy_violation;
  }
  return check_chain(*parent);
}

outcome<key_record_t> manager::create_key(
    const key_role_t role,
    const std::optional<hash32_t>& parent_id,
    const std::optional<std::string>& app_id,
    const quorum_proof_t& proof) {
  auto lock = std::scoped_lock{mutex_};
  auto subject = ceremony_subject(role, parent_id, app_id);

  auto ceremony = quorum_policy_t{
      .authorizers = options_.ceremony_participants,
      .threshold = static_cast<uint32_t>(options_.ceremony_participants.size()),
      .vote_ttl_ms = options_.signing_quorum.vote_ttl_ms};
  if (check_proof(proof, quorum_action_t::create_key, subject, ceremony,
                  clock_()) != error_code_t::ok) {
    record_security_event(audit_event_type_t::authorization_mismatch, subject,
                          "key ceremony proof rejected");
    return make_error<key_record_t>(error_code_t::authorization_mismatch,
                                    "key ceremony requires every participant");
  }

  if (auto code = check_parent(role, parent_id, app_id);
      code != error_code_t::ok) {
    return make_error<key_record_t>(
        code, "cannot create " + std::string{to_string(role)} + " key: " +
                  std::string{to_string(code)});
  }

  auto handle = hsm_.generate();
  if (!handle.ok()) {
    record_security_event(audit_event_type_t::hsm_unavailable, subject,
                          "key generation failed: " + handle.log);
    return make_error<key_record_t>(handle.code, handle.log);
  }
  auto public_key = hsm_.public_key(*handle.value);
  if (!public_key.ok()) {
    record_security_event(audit_event_type_t::hsm_unavailable, subject,
                          "public key unavailable: " + public_key.log);
    return make_error<key_record_t>(public_key.code, public_key.log);
  }

  auto record = key_record_t{};
  record.key_id =
      warden::blake3::hash(kKeyIdDomain, public_key.value->public_key);
  record.role = role;
  record.handle = *handle.value;
  record.public_key = *public_key.value;
  record.parent_id = parent_id;
  record.app_id = app_id;
  record.created_at = clock_();
  record.status = key_status_t::active;

  auto batch = warden::storage::write_batch_t{};
  batch.puts.emplace_back(key::make_key_record_key(record.key_id),
                          encoder_.encode(record));
  audit_.append(key_event(audit_event_type_t::key_created, record.key_id,
                          audit_severity_t::info,
                          "created " + std::string{to_string(role)} + " key"),
                std::move(batch));
  spdlog::info("Created {} key {}", to_string(role), to_hex(record.key_id));
  return make_ok(record);
}

outcome<key_record_t> manager::revoke(const hash32_t& key_id,
                                      const quorum_proof_t& proof) {
  auto lock = std::scoped_lock{mutex_};
  auto record = get(key_id);
  if (!record) {
    return make_error<key_record_t>(error_code_t::key_missing, "unknown key");
  }
  if (record->status == key_status_t::revoked) {
    return make_error<key_record_t>(error_code_t::key_revoked,
                                    "key already revoked");
  }
  if (check_proof(proof, quorum_action_t::revoke_key, key_id,
                  options_.signing_quorum, clock_()) != error_code_t::ok) {
    record_security_event(audit_event_type_t::authorization_mismatch, key_id,
                          "revocation proof rejected");
    return make_error<key_record_t>(error_code_t::authorization_mismatch,
                                    "revocation requires a valid quorum proof");
  }

  record->status = key_status_t::revoked;
  record->revoked_at = clock_();

  auto batch = warden::storage::write_batch_t{};
  batch.puts.emplace_back(key::make_key_record_key(key_id),
                          encoder_.encode(*record));
  audit_.append(key_event(audit_event_type_t::key_revoked, key_id,
                          audit_severity_t::warning,
                          "revoked " + std::string{to_string(record->role)} +
                              " key"),
                std::move(batch));
  spdlog::warn("Revoked {} key {}", to_string(record->role), to_hex(key_id));
  return make_ok(*record);
}

bool manager::request_targets(const hash32_t& request_id,
                              const hash32_t& key_id,
                              const hash32_t& digest) const {
  auto request = storage_.get<signing_request_t>(
      encoder_, key::make_signing_request_key(request_id));
  return request && request->key_id == key_id &&
         request->artifact_digest == digest &&
         std::holds_alternative<authorized_t>(request->state);
}

std::timed_mutex& manager::slot(const hash32_t& key_id) {
  auto lock = std::scoped_lock{mutex_};
  auto& entry = slots_[key_id];
  if (!entry) {
    entry = std::make_unique<std::timed_mutex>();
  }
  return *entry;
}

outcome<ed25519_signature_t> manager::sign(const hash32_t& key_id,
                                           const hash32_t& digest,
                                           const quorum_proof_t& proof) {
  auto record = get(key_id);
  if (!record) {
    return make_error<ed25519_signature_t>(error_code_t::key_missing,
                                           "unknown key");
  }

  if (check_proof(proof, quorum_action_t::sign_artifact, digest,
                  options_.signing_quorum, clock_()) != error_code_t::ok ||
      !request_targets(proof.request_id, key_id, digest)) {
    record_security_event(audit_event_type_t::authorization_mismatch, key_id,
                          "signing proof rejected for digest " +
                              to_hex(digest));
    return make_error<ed25519_signature_t>(
        error_code_t::authorization_mismatch,
        "quorum proof does not authorize this digest with this key");
  }

  if (auto code = check_chain(*record); code != error_code_t::ok) {
    spdlog::warn("Refusing to sign with key {}: {}", to_hex(key_id),
                 to_string(code));
    return make_error<ed25519_signature_t>(code, "key is not usable");
  }

  auto& key_slot = slot(key_id);
  auto slot_lock = std::unique_lock{key_slot, std::defer_lock};
  if (!slot_lock.try_lock_for(
          std::chrono::milliseconds{options_.slot_timeout_ms})) {
    return make_error<ed25519_signature_t>(
        error_code_t::hsm_timeout, "signing slot for key is still busy");
  }

  auto signature = hsm_.sign(record->handle, signing_message(digest));
  if (!signature.ok()) {
    record_security_event(audit_event_type_t::hsm_unavailable, key_id,
                          "signing failed closed: " + signature.log);
    return signature;
  }
  spdlog::info("Signed digest {} with key {}", to_hex(digest), to_hex(key_id));
  return signature;
}

bool manager::verify_signature(const hash32_t& key_id,
                               const hash32_t& digest,
                               const ed25519_signature_t& signature) const {
  auto record = get(key_id);
  if (!record) {
    return false;
  }
  return warden::crypto::verify_signature(signing_message(digest),
                                          signer_id_t{record->public_key},
                                          signature_t{signature});
}

bool manager::valid_at(const hash32_t& key_id,
                       const timestamp_milliseconds_t at) const {
  auto current = get(key_id);
  for (auto depth = 0; current && depth < kMaxChainDepth; ++depth) {
    if (at < current->created_at ||
        (current->revoked_at && at >= *current->revoked_at)) {
      return false;
    }
    if (!current->parent_id) {
      return true;
    }
    current = get(*current->parent_id);
  }
  return false;
}

std::optional<key_record_t> manager::find_signing_key(
    const std::string& app_id) const {
  auto best_app = std::optional<key_record_t>{};
  auto best_repository = std::optional<key_record_t>{};
  for (auto& record : list()) {
    if (check_chain(record) != error_code_t::ok) {
      continue;
    }
    if (record.role == key_role_t::app_signing && record.app_id == app_id) {
      if (!best_app || record.created_at > best_app->created_at) {
        best_app = record;
      }
    } else if (record.role == key_role_t::repository_signing) {
      if (!best_repository ||
          record.created_at > best_repository->created_at) {
        best_repository = record;
      }
    }
  }
  return best_app ? best_app : best_repository;
}

}  // namespace warden::keys
