#pragma once

#include <warden/audit/log.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/outcome.hpp>
#include <warden/schema/suspension_record.hpp>
#include <warden/storage/rocksdb/storage.hpp>

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warden::suspension {

inline constexpr auto kSuspensionDomain =
    std::string_view{"warden.suspension.v1"};
inline constexpr auto kApplicationDomain =
    std::string_view{"warden.application.v1"};

struct controller_options final {
  // separate from the publication quorum
  std::vector<warden::schema::signer_id_t> authorities;
  warden::schema::duration_milliseconds_t token_ttl_ms{600000};
};

/// The message an authority signs for a token.
warden::schema::hash32_t token_message(
    const warden::schema::authority_token_t& token);

/// Subject hash used for application-wide suspensions.
warden::schema::hash32_t application_subject(std::string_view app_id);

/// Emergency pull of artifacts or whole applications. Suspension state only
/// changes through a signed, single-use authority token; nothing in the
/// build or signing path can lift it.
class controller final {
 public:
  controller(warden::schema::encoding::scale_encoder_t& encoder,
             warden::storage::rocksdb_storage_t& storage,
             warden::audit::log& audit,
             controller_options options,
             warden::schema::time_source_t clock);

  controller(const controller&) = delete;
  controller& operator=(const controller&) = delete;

  warden::schema::outcome<warden::schema::suspension_record_t> suspend(
      const warden::schema::hash32_t& artifact_digest,
      const std::string& reason,
      const warden::schema::authority_token_t& token);
  warden::schema::outcome<warden::schema::suspension_record_t>
  suspend_application(const std::string& app_id,
                      const std::string& reason,
                      const warden::schema::authority_token_t& token);
  warden::schema::outcome<warden::schema::suspension_record_t> unsuspend(
      const warden::schema::hash32_t& artifact_digest,
      const std::string& reason,
      const warden::schema::authority_token_t& token);
  warden::schema::outcome<warden::schema::suspension_record_t>
  unsuspend_application(const std::string& app_id,
                        const std::string& reason,
                        const warden::schema::authority_token_t& token);

  /// True when the artifact, or the application it was published for, is
  /// suspended. Publishers call this on every serve.
  bool is_suspended(const warden::schema::hash32_t& artifact_digest) const;
  bool is_application_suspended(const std::string& app_id) const;

  /// Every suspend and unsuspend for the subject, oldest first.
  std::vector<warden::schema::suspension_record_t> history(
      warden::schema::suspension_subject_t subject_kind,
      const warden::schema::hash32_t& subject) const;

 private:
  warden::schema::outcome<warden::schema::suspension_record_t> apply(
      warden::schema::suspension_action_t action,
      warden::schema::suspension_subject_t subject_kind,
      const warden::schema::hash32_t& subject,
      const std::string& label,
      const std::string& reason,
      const warden::schema::authority_token_t& token);
  warden::schema::error_code_t check_token(
      const warden::schema::authority_token_t& token,
      warden::schema::suspension_action_t action,
      warden::schema::suspension_subject_t subject_kind,
      const warden::schema::hash32_t& subject,
      const std::string& reason,
      warden::schema::timestamp_milliseconds_t now) const;
  void reject(const warden::schema::hash32_t& subject,
              warden::schema::error_code_t code,
              const std::string& detail);
  bool suspended(warden::schema::suspension_subject_t subject_kind,
                 const warden::schema::hash32_t& subject) const;

  mutable std::mutex mutex_;
  warden::schema::encoding::scale_encoder_t& encoder_;
  warden::storage::rocksdb_storage_t& storage_;
  warden::audit::log& audit_;
  controller_options options_;
  warden::schema::time_source_t clock_;
};

}  // namespace warden::suspension
