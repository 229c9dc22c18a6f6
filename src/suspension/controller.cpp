#include <warden/blake3/hash.hpp>
#include <warden/crypto/verify.hpp>
#include <warden/keys/quorum.hpp>
#include <warden/schema/key/keyspace.hpp>
#include <warden/schema/signing_request.hpp>
#include <warden/suspension/controller.hpp>

#include <spdlog/spdlog.h>

#include <tuple>
#include <utility>

using namespace warden::schema;

namespace warden::suspension {

hash32_t token_message(const authority_token_t& token) {
  auto encoder = encoding::scale_encoder_t{};
  auto encoded = encoder.encode(
      std::tuple{token.action, token.subject_kind, token.subject, token.label,
                 token.reason, token.issued_at, token.nonce, token.authority});
  return warden::blake3::hash(kSuspensionDomain, encoded);
}

hash32_t application_subject(const std::string_view app_id) {
  return warden::blake3::hash(kApplicationDomain, make_bytes_view(app_id));
}

controller::controller(encoding::scale_encoder_t& encoder,
                       warden::storage::rocksdb_storage_t& storage,
                       warden::audit::log& audit,
                       controller_options options,
                       time_source_t clock)
    : encoder_{encoder},
      storage_{storage},
      audit_{audit},
      options_{std::move(options)},
      clock_{std::move(clock)} {
  spdlog::info("Suspension controller ready with {} authority key(s)",
               options_.authorities.size());
}

error_code_t controller::check_token(const authority_token_t& token,
                                     const suspension_action_t action,
                                     const suspension_subject_t subject_kind,
                                     const hash32_t& subject,
                                     const std::string& reason,
                                     const timestamp_milliseconds_t now) const {
  if (token.action != action || token.subject_kind != subject_kind ||
      token.subject != subject || token.reason != reason) {
    return error_code_t::suspension_unauthorized;
  }
  if (!warden::keys::is_member(options_.authorities, token.authority)) {
    return error_code_t::suspension_unauthorized;
  }
  if (!warden::crypto::verify_signature(token_message(token), token.authority,
                                        token.signature)) {
    return error_code_t::suspension_unauthorized;
  }
  if (token.issued_at > now || now - token.issued_at > options_.token_ttl_ms) {
    return error_code_t::suspension_unauthorized;
  }
  if (storage_.contains(key::make_token_nonce_key(token.nonce))) {
    return error_code_t::token_replayed;
  }
  return error_code_t::ok;
}

void controller::reject(const hash32_t& subject,
                        const error_code_t code,
                        const std::string& detail) {
  spdlog::error("Suspension token rejected ({}): {}", to_string(code), detail);
  audit_.append(audit_event_t{.type = audit_event_type_t::suspension_rejected,
                              .entity_kind = entity_kind_t::suspension,
                              .entity_id = subject,
                              .severity = audit_severity_t::error,
                              .message = detail,
                              .payload = {}});
}

bool controller::suspended(const suspension_subject_t subject_kind,
                           const hash32_t& subject) const {
  return storage_.contains(
      key::make_suspension_key(static_cast<uint8_t>(subject_kind), subject));
}

outcome<suspension_record_t> controller::apply(
    const suspension_action_t action,
    const suspension_subject_t subject_kind,
    const hash32_t& subject,
    const std::string& label,
    const std::string& reason,
    const authority_token_t& token) {
  auto lock = std::scoped_lock{mutex_};
  auto now = clock_();

  if (auto code =
          check_token(token, action, subject_kind, subject, reason, now);
      code != error_code_t::ok) {
    reject(subject, code,
           std::string{to_string(action)} + " of " +
               std::string{to_string(subject_kind)} + " " + to_hex(subject) +
               " by " + to_string(token.authority));
    return make_error<suspension_record_t>(code, "authority token rejected");
  }

  auto is_suspended_now = suspended(subject_kind, subject);
  if (action == suspension_action_t::suspend && is_suspended_now) {
    return make_error<suspension_record_t>(error_code_t::already_suspended,
                                           "subject is already suspended");
  }
  if (action == suspension_action_t::unsuspend && !is_suspended_now) {
    return make_error<suspension_record_t>(error_code_t::not_suspended,
                                           "subject is not suspended");
  }

  auto record = suspension_record_t{};
  record.subject_kind = subject_kind;
  record.subject = subject;
  record.label = label;
  record.action = action;
  record.reason = reason;
  record.authority = token.authority;
  record.token_nonce = token.nonce;
  record.recorded_at = now;

  auto kind = static_cast<uint8_t>(subject_kind);
  auto event = audit_event_t{
      .type = action == suspension_action_t::suspend
                  ? audit_event_type_t::suspended
                  : audit_event_type_t::unsuspended,
      .entity_kind = entity_kind_t::suspension,
      .entity_id = subject,
      .severity = audit_severity_t::warning,
      .message = std::string{to_string(subject_kind)} + " " +
                 std::string{to_string(action)} + ": " + reason,
      .payload = encoder_.encode(std::tuple{kind, label})};

  audit_.append(event, [&](const audit_entry_t& entry,
                           warden::storage::write_batch_t& batch) {
    record.audit_sequence = entry.sequence;
    auto encoded = encoder_.encode(record);
    if (action == suspension_action_t::suspend) {
      batch.puts.emplace_back(key::make_suspension_key(kind, subject), encoded);
    } else {
      batch.deletes.push_back(key::make_suspension_key(kind, subject));
    }
    batch.puts.emplace_back(
        key::make_suspension_history_key(kind, subject, entry.sequence),
        encoded);
    batch.puts.emplace_back(key::make_token_nonce_key(token.nonce),
                            encoder_.encode(entry.sequence));
  });

  spdlog::warn("{} {} {} by {}: {}", to_string(subject_kind),
               label.empty() ? to_hex(subject) : label, to_string(action),
               to_string(token.authority), reason);
  return make_ok(record);
}

outcome<suspension_record_t> controller::suspend(
    const hash32_t& artifact_digest,
    const std::string& reason,
    const authority_token_t& token) {
  return apply(suspension_action_t::suspend, suspension_subject_t::artifact,
               artifact_digest, {}, reason, token);
}

outcome<suspension_record_t> controller::suspend_application(
    const std::string& app_id,
    const std::string& reason,
    const authority_token_t& token) {
  return apply(suspension_action_t::suspend, suspension_subject_t::application,
               application_subject(app_id), app_id, reason, token);
}

outcome<suspension_record_t> controller::unsuspend(
    const hash32_t& artifact_digest,
    const std::string& reason,
    const authority_token_t& token) {
  return apply(suspension_action_t::unsuspend, suspension_subject_t::artifact,
               artifact_digest, {}, reason, token);
}

outcome<suspension_record_t> controller::unsuspend_application(
    const std::string& app_id,
    const std::string& reason,
    const authority_token_t& token) {
  return apply(suspension_action_t::unsuspend,
               suspension_subject_t::application, application_subject(app_id),
               app_id, reason, token);
}

bool controller::is_application_suspended(const std::string& app_id) const {
  return suspended(suspension_subject_t::application,
                   application_subject(app_id));
}

bool controller::is_suspended(const hash32_t& artifact_digest) const {
  if (suspended(suspension_subject_t::artifact, artifact_digest)) {
    return true;
  }
  auto published = storage_.get<publication_record_t>(
      encoder_, key::make_publication_key(artifact_digest));
  return published && is_application_suspended(published->app_id);
}

std::vector<suspension_record_t> controller::history(
    const suspension_subject_t subject_kind,
    const hash32_t& subject) const {
  auto out = std::vector<suspension_record_t>{};
  for (const auto& entry :
       storage_.list_by_prefix(key::make_suspension_history_prefix_key(
           static_cast<uint8_t>(subject_kind), subject))) {
    out.push_back(encoder_.decode<suspension_record_t>(entry.second));
  }
  return out;
}

}  // namespace warden::suspension
