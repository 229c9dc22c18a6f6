#pragma once

#include <warden/build/executor.hpp>
#include <warden/build/source.hpp>
#include <warden/common/critical.hpp>
#include <warden/crypto/sign.hpp>
#include <warden/keys/quorum.hpp>
#include <warden/schema/authorization_record.hpp>
#include <warden/schema/build_job.hpp>
#include <warden/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace warden::testing {

inline warden::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = warden::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Temporary directory removed on destruction.
class scoped_dir final {
 public:
  explicit scoped_dir(const std::string_view prefix)
      : path_{make_db_path(prefix)} {
    std::filesystem::create_directories(path_);
  }
  scoped_dir(const scoped_dir&) = delete;
  scoped_dir& operator=(const scoped_dir&) = delete;
  ~scoped_dir() { remove_path(path_.string()); }

  const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
};

/// Clock the test moves by hand. Copies of `source()` observe every change.
class manual_clock final {
 public:
  explicit manual_clock(const warden::schema::timestamp_milliseconds_t start =
                            1'700'000'000'000)
      : now_{std::make_shared<std::atomic<uint64_t>>(start)} {}

  warden::schema::time_source_t source() const {
    return [now = now_] { return now->load(); };
  }
  warden::schema::timestamp_milliseconds_t now() const { return now_->load(); }
  void advance(const warden::schema::duration_milliseconds_t ms) {
    now_->fetch_add(ms);
  }
  void set(const warden::schema::timestamp_milliseconds_t at) {
    now_->store(at);
  }

 private:
  std::shared_ptr<std::atomic<uint64_t>> now_;
};

/// A human key holder casting votes.
class voter final {
 public:
  voter() : key_{generate()} {}

  warden::schema::signer_id_t signer() const { return key_.signer(); }
  const warden::crypto::ed25519_key& key() const { return key_; }

  warden::schema::authorization_record_t vote(
      const warden::schema::quorum_action_t action,
      const warden::schema::hash32_t& request_id,
      const warden::schema::hash32_t& digest,
      const warden::schema::authorization_decision_t decision,
      const warden::schema::timestamp_milliseconds_t at) const {
    auto record = warden::schema::authorization_record_t{};
    record.action = action;
    record.request_id = request_id;
    record.authorizer = signer();
    record.decision = decision;
    record.bound_digest = digest;
    record.authorized_at = at;
    record.signature = warden::schema::signature_t{
        key_.sign(warden::keys::authorization_message(record))};
    return record;
  }

  warden::schema::authorization_record_t approve(
      const warden::schema::hash32_t& request_id,
      const warden::schema::hash32_t& digest,
      const warden::schema::timestamp_milliseconds_t at) const {
    return vote(warden::schema::quorum_action_t::sign_artifact, request_id,
                digest, warden::schema::authorization_decision_t::approve, at);
  }

  warden::schema::authorization_record_t deny(
      const warden::schema::hash32_t& request_id,
      const warden::schema::hash32_t& digest,
      const warden::schema::timestamp_milliseconds_t at) const {
    return vote(warden::schema::quorum_action_t::sign_artifact, request_id,
                digest, warden::schema::authorization_decision_t::deny, at);
  }

 private:
  static warden::crypto::ed25519_key generate() {
    auto key = warden::crypto::ed25519_key::generate();
    if (!key) {
      warden::common::critical("test key generation failed");
    }
    return *key;
  }

  warden::crypto::ed25519_key key_;
};

inline std::vector<voter> make_voters(const std::size_t count) {
  return std::vector<voter>(count);
}

inline std::vector<warden::schema::signer_id_t> signers_of(
    const std::vector<voter>& voters) {
  auto out = std::vector<warden::schema::signer_id_t>{};
  for (const auto& v : voters) {
    out.push_back(v.signer());
  }
  return out;
}

/// Approvals from the given voters packaged as a proof.
inline warden::schema::quorum_proof_t make_proof(
    const warden::schema::quorum_action_t action,
    const warden::schema::hash32_t& request_id,
    const warden::schema::hash32_t& subject,
    const std::vector<voter>& voters,
    const warden::schema::timestamp_milliseconds_t at) {
  auto proof = warden::schema::quorum_proof_t{};
  proof.action = action;
  proof.request_id = request_id;
  proof.subject = subject;
  for (const auto& v : voters) {
    proof.approvals.push_back(
        v.vote(action, request_id, subject,
               warden::schema::authorization_decision_t::approve, at));
  }
  return proof;
}

inline warden::schema::build_job_t make_job(const std::string& app_id,
                                            const uint32_t n,
                                            const uint32_t k,
                                            const std::string& commit =
                                                "0123456789abcdef") {
  auto job = warden::schema::build_job_t{};
  job.app_id = app_id;
  job.source.locator = "https://git.example.org/" + app_id + ".git";
  job.source.commit = commit;
  job.source.tag = "v1.0.0";
  job.recipe_id = "gradle-release";
  job.parameters.push_back({.name = "flavor", .value = "release"});
  job.n = n;
  job.k = k;
  return job;
}

inline void sign_source(warden::schema::source_ref_t& source,
                        const voter& maintainer) {
  source.signer = maintainer.signer();
  source.signature = warden::schema::signature_t{
      maintainer.key().sign(warden::build::source_message(source))};
}

/// What one scripted attempt does.
struct scripted_attempt final {
  warden::schema::builder_status_t status{
      warden::schema::builder_status_t::success};
  warden::schema::bytes_t artifact;
  std::chrono::milliseconds delay{0};
  std::string error;
};

using build_script_t = std::function<scripted_attempt(
    const std::string& builder_id, uint32_t attempt)>;

/// Executor that follows a script instead of running recipes. Attempts are
/// counted per builder and source commit.
class scripted_executor final {
 public:
  explicit scripted_executor(build_script_t script)
      : state_{std::make_shared<state>()} {
    state_->script = std::move(script);
  }

  warden::build::build_executor_t executor() const {
    return [state = state_](const warden::build::execution_context_t& context) {
      auto attempt = uint32_t{};
      {
        auto lock = std::scoped_lock{state->mutex};
        attempt = ++state->attempts[context.lease.builder_id() + "|" +
                                    context.job.source.commit];
        ++state->total;
      }
      auto step = state->script(context.lease.builder_id(), attempt);
      auto outcome = warden::build::execution_outcome_t{};
      outcome.log = "builder " + context.lease.builder_id() + " attempt " +
                    std::to_string(attempt);

      const auto until = std::chrono::steady_clock::now() + step.delay;
      while (std::chrono::steady_clock::now() < until) {
        if (context.cancelled) {
          outcome.status = warden::schema::builder_status_t::failed;
          outcome.error = "interrupted";
          return outcome;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{2});
      }

      outcome.status = step.status;
      outcome.error = step.error;
      if (step.status == warden::schema::builder_status_t::success) {
        auto path = context.lease.output() / "artifact";
        auto out = std::ofstream{path, std::ios::binary};
        out.write(reinterpret_cast<const char*>(step.artifact.data()),
                  static_cast<std::streamsize>(step.artifact.size()));
        outcome.artifact = path;
      }
      return outcome;
    };
  }

  uint32_t total_attempts() const {
    auto lock = std::scoped_lock{state_->mutex};
    return state_->total;
  }

 private:
  struct state final {
    std::mutex mutex;
    build_script_t script;
    std::map<std::string, uint32_t> attempts;
    uint32_t total{};
  };

  std::shared_ptr<state> state_;
};

/// Every builder produces the same bytes.
inline build_script_t reproducible(warden::schema::bytes_t artifact) {
  return [artifact = std::move(artifact)](const std::string&, uint32_t) {
    return scripted_attempt{.status = warden::schema::builder_status_t::success,
                            .artifact = artifact,
                            .delay = {},
                            .error = {}};
  };
}

/// Named builders produce their own bytes; the rest produce `common`.
inline build_script_t per_builder(
    warden::schema::bytes_t common,
    std::map<std::string, warden::schema::bytes_t> overrides) {
  return [common = std::move(common), overrides = std::move(overrides)](
             const std::string& builder_id, uint32_t) {
    auto it = overrides.find(builder_id);
    return scripted_attempt{
        .status = warden::schema::builder_status_t::success,
        .artifact = it == overrides.end() ? common : it->second,
        .delay = {},
        .error = {}};
  };
}

inline std::vector<std::string> builder_ids(const std::size_t count) {
  auto out = std::vector<std::string>{};
  for (std::size_t i = 0; i < count; ++i) {
    out.push_back("builder-" + std::to_string(i + 1));
  }
  return out;
}

}  // namespace warden::testing
