#include <gtest/gtest.h>
#include <warden/execution/engine.hpp>
#include <warden/testing/common.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <variant>

namespace {

using namespace std::chrono_literals;
using warden::schema::error_code_t;
using warden::schema::job_state_t;
using warden::schema::quorum_state_t;

constexpr auto kAppId = "org.example.notes";
constexpr auto kWait = 20s;
constexpr auto kRequestTtlMs = warden::schema::duration_milliseconds_t{
    24 * 60 * 60 * 1000};

warden::schema::bytes_t bytes_of(const std::string& text) {
  return warden::schema::make_bytes(text);
}

/// Engine wired to a scripted executor, with a 2-of-3 publication quorum.
class engine_harness final {
 public:
  engine_harness(const std::string_view prefix,
                 warden::testing::build_script_t script)
      : dir_{prefix},
        storage_{warden::storage::make_storage<
            warden::storage::rocksdb_storage_tag>(
            (dir_.path() / "db").string())},
        authorizers_{warden::testing::make_voters(3)},
        participants_{warden::testing::make_voters(2)},
        executor_{std::move(script)},
        engine_{encoder_, storage_, executor_.executor(), options(),
                clock_.source()} {}

  warden::execution::engine& engine() { return engine_; }
  warden::testing::manual_clock& clock() { return clock_; }
  const std::vector<warden::testing::voter>& authorizers() const {
    return authorizers_;
  }
  const warden::testing::voter& authority() const { return authority_; }

  /// Root, repository and app keys through full-participant ceremonies.
  warden::schema::key_record_t make_hierarchy() {
    auto root = ceremony(warden::schema::key_role_t::root, std::nullopt,
                         std::nullopt);
    auto repository =
        ceremony(warden::schema::key_role_t::repository_signing,
                 root.key_id, std::nullopt);
    return ceremony(warden::schema::key_role_t::app_signing,
                    repository.key_id, std::string{kAppId});
  }

  warden::schema::hash32_t submit(
      const std::string& commit = "0123456789abcdef") {
    auto submitted = engine_.submit_build_job(
        warden::testing::make_job(kAppId, 3, 3, commit));
    if (!submitted.ok()) {
      warden::common::critical("job submission failed");
    }
    return *submitted.value;
  }

  /// The job's signing request once the completion callback has opened it.
  std::optional<warden::schema::signing_request_t> wait_for_request(
      const warden::schema::hash32_t& job_id) {
    const auto until = std::chrono::steady_clock::now() + kWait;
    while (std::chrono::steady_clock::now() < until) {
      auto view = engine_.build_job(job_id);
      if (view && view->signing_request) {
        return view->signing_request;
      }
      std::this_thread::sleep_for(5ms);
    }
    return std::nullopt;
  }

  /// The first audit entry of `type` recorded against `entity`.
  std::optional<warden::schema::audit_entry_t> wait_for_audit(
      const warden::schema::audit_event_type_t type,
      const warden::schema::hash32_t& entity) {
    const auto until = std::chrono::steady_clock::now() + kWait;
    while (std::chrono::steady_clock::now() < until) {
      for (const auto& entry : engine_.audit_range(
               0, engine_.audit().tail_sequence())) {
        if (entry.type == type && entry.entity_id == entity) {
          return entry;
        }
      }
      std::this_thread::sleep_for(5ms);
    }
    return std::nullopt;
  }

  warden::schema::authorization_record_t approve(
      const std::size_t authorizer,
      const warden::schema::signing_request_t& request) {
    return authorizers_[authorizer].approve(
        request.request_id, request.artifact_digest, clock_.now());
  }

  warden::schema::authority_token_t suspend_token(
      const warden::schema::hash32_t& digest,
      const std::string& reason) {
    auto token = warden::schema::authority_token_t{};
    token.action = warden::schema::suspension_action_t::suspend;
    token.subject_kind = warden::schema::suspension_subject_t::artifact;
    token.subject = digest;
    token.reason = reason;
    token.issued_at = clock_.now();
    token.nonce = warden::testing::make_hash(77);
    token.authority = authority_.signer();
    token.signature = warden::schema::signature_t{
        authority_.key().sign(warden::suspension::token_message(token))};
    return token;
  }

 private:
  warden::execution::engine_options options() const {
    auto quorum = warden::keys::quorum_policy_t{
        .authorizers = warden::testing::signers_of(authorizers_),
        .threshold = 2,
        .vote_ttl_ms = 60 * 60 * 1000};
    auto out = warden::execution::engine_options{};
    out.sandbox_root = dir_.path() / "sandboxes";
    out.artifact_dir = dir_.path() / "artifacts";
    out.build.builders = warden::testing::builder_ids(3);
    out.build.require_signed_sources = false;
    out.keys.signing_quorum = quorum;
    out.keys.ceremony_participants =
        warden::testing::signers_of(participants_);
    out.signing.quorum = quorum;
    out.signing.request_ttl_ms = kRequestTtlMs;
    out.suspension.authorities = {authority_.signer()};
    return out;
  }

  warden::schema::key_record_t ceremony(
      const warden::schema::key_role_t role,
      const std::optional<warden::schema::hash32_t>& parent,
      const std::optional<std::string>& app_id) {
    auto subject =
        warden::keys::manager::ceremony_subject(role, parent, app_id);
    auto proof = warden::testing::make_proof(
        warden::schema::quorum_action_t::create_key, subject, subject,
        participants_, clock_.now());
    auto created = engine_.keys().create_key(role, parent, app_id, proof);
    if (!created.ok()) {
      warden::common::critical("key ceremony failed");
    }
    return *created.value;
  }

  warden::testing::scoped_dir dir_;
  warden::schema::encoding::scale_encoder_t encoder_;
  warden::storage::rocksdb_storage_t storage_;
  warden::testing::manual_clock clock_;
  std::vector<warden::testing::voter> authorizers_;
  std::vector<warden::testing::voter> participants_;
  warden::testing::voter authority_;
  warden::testing::scripted_executor executor_;
  warden::execution::engine engine_;
};

}  // namespace

TEST(engine, reproducible_build_is_signed_after_quorum) {
  auto harness = engine_harness{"warden_engine_signed",
                                warden::testing::reproducible(
                                    bytes_of("reproducible apk"))};
  auto app_key = harness.make_hierarchy();
  auto job_id = harness.submit();

  auto request = harness.wait_for_request(job_id);
  ASSERT_TRUE(request.has_value());
  EXPECT_EQ(request->key_id, app_key.key_id);
  EXPECT_EQ(warden::schema::quorum_state_of(request->state),
            quorum_state_t::pending);

  auto view = harness.engine().build_job(job_id);
  ASSERT_TRUE(view.has_value());
  EXPECT_EQ(view->status.state, job_state_t::verified);
  ASSERT_TRUE(view->decision.has_value());
  EXPECT_EQ(view->decision->winning_digest, request->artifact_digest);

  auto first = harness.engine().authorize(job_id, harness.approve(0, *request));
  ASSERT_TRUE(first.ok()) << first.log;
  EXPECT_EQ(warden::schema::quorum_state_of(first.value->state),
            quorum_state_t::pending);

  auto second =
      harness.engine().authorize(job_id, harness.approve(1, *request));
  ASSERT_TRUE(second.ok()) << second.log;
  const auto* done = std::get_if<warden::schema::signed_t>(&second.value->state);
  ASSERT_NE(done, nullptr);
  EXPECT_TRUE(harness.engine().keys().verify_signature(
      app_key.key_id, request->artifact_digest, done->signature));
  EXPECT_FALSE(harness.engine().is_suspended(request->artifact_digest));
  EXPECT_TRUE(harness.engine().verify_audit().intact);
}

TEST(engine, dissent_never_opens_signing_request) {
  auto harness = engine_harness{
      "warden_engine_dissent",
      warden::testing::per_builder(bytes_of("apk"),
                                   {{"builder-2", bytes_of("apk+timestamp")}})};
  harness.make_hierarchy();
  auto job_id = harness.submit();

  auto status = harness.engine().orchestrator().wait(job_id, kWait);
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(status->state, job_state_t::rejected);
  EXPECT_EQ(status->reason, error_code_t::no_consensus);

  auto view = harness.engine().build_job(job_id);
  ASSERT_TRUE(view.has_value());
  ASSERT_TRUE(view->decision.has_value());
  EXPECT_EQ(view->decision->outcome,
            warden::schema::verification_outcome_t::no_consensus);
  EXPECT_FALSE(view->decision->diff_reports.empty());
  EXPECT_FALSE(view->signing_request.has_value());

  auto vote = harness.authorizers()[0].approve(
      warden::testing::make_hash(1), warden::testing::make_hash(2),
      harness.clock().now());
  EXPECT_EQ(harness.engine().authorize(job_id, vote).code,
            error_code_t::not_found);
}

TEST(engine, unanswered_request_expires_on_sweep) {
  auto harness = engine_harness{
      "warden_engine_expiry", warden::testing::reproducible(bytes_of("apk"))};
  harness.make_hierarchy();
  auto job_id = harness.submit();
  auto request = harness.wait_for_request(job_id);
  ASSERT_TRUE(request.has_value());

  ASSERT_TRUE(
      harness.engine().authorize(job_id, harness.approve(0, *request)).ok());
  harness.clock().advance(kRequestTtlMs + 1);
  harness.engine().sweep();

  auto view = harness.engine().build_job(job_id);
  ASSERT_TRUE(view.has_value());
  ASSERT_TRUE(view->signing_request.has_value());
  EXPECT_EQ(warden::schema::quorum_state_of(view->signing_request->state),
            quorum_state_t::expired);

  auto late = harness.engine().authorize(job_id, harness.approve(1, *request));
  EXPECT_EQ(late.code, error_code_t::request_finalized);
}

TEST(engine, vote_for_other_request_is_rejected) {
  auto harness = engine_harness{
      "warden_engine_mismatch", warden::testing::reproducible(bytes_of("apk"))};
  harness.make_hierarchy();
  auto job_id = harness.submit();
  auto request = harness.wait_for_request(job_id);
  ASSERT_TRUE(request.has_value());

  auto stray = harness.authorizers()[0].approve(
      warden::testing::make_hash(200), request->artifact_digest,
      harness.clock().now());
  auto result = harness.engine().authorize(job_id, stray);
  EXPECT_EQ(result.code, error_code_t::authorization_mismatch);
  ASSERT_TRUE(result.value.has_value());
  EXPECT_EQ(result.value->request_id, request->request_id);
}

TEST(engine, published_artifact_can_be_suspended) {
  auto harness = engine_harness{
      "warden_engine_suspend", warden::testing::reproducible(bytes_of("apk"))};
  harness.make_hierarchy();
  auto job_id = harness.submit();
  auto request = harness.wait_for_request(job_id);
  ASSERT_TRUE(request.has_value());
  ASSERT_TRUE(
      harness.engine().authorize(job_id, harness.approve(0, *request)).ok());
  auto signed_request =
      harness.engine().authorize(job_id, harness.approve(2, *request));
  ASSERT_TRUE(signed_request.ok()) << signed_request.log;

  const auto digest = request->artifact_digest;
  const auto tail = harness.engine().audit().tail_sequence();
  auto suspended = harness.engine().suspension().suspend(
      digest, "malware reported", harness.suspend_token(digest, "malware reported"));
  ASSERT_TRUE(suspended.ok()) << suspended.log;
  EXPECT_TRUE(harness.engine().is_suspended(digest));
  EXPECT_EQ(suspended.value->audit_sequence, tail + 1);

  auto entries = harness.engine().audit_range(tail + 1, tail + 1);
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0].type, warden::schema::audit_event_type_t::suspended);
  EXPECT_TRUE(harness.engine().verify_audit().intact);
  EXPECT_TRUE(harness.engine().verify_audit(1, tail + 1).intact);
}

TEST(engine, unopened_signing_request_is_audited) {
  auto harness = engine_harness{
      "warden_engine_unopened", warden::testing::reproducible(bytes_of("apk"))};
  harness.make_hierarchy();
  auto first_job = harness.submit("1111111111111111");
  auto request = harness.wait_for_request(first_job);
  ASSERT_TRUE(request.has_value());

  // same artifact again while the first request still awaits its quorum
  auto second_job = harness.submit("2222222222222222");
  auto status = harness.engine().orchestrator().wait(second_job, kWait);
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(status->state, job_state_t::verified);

  auto failure = harness.wait_for_audit(
      warden::schema::audit_event_type_t::signing_failed, second_job);
  ASSERT_TRUE(failure.has_value());
  EXPECT_EQ(failure->severity, warden::schema::audit_severity_t::error);
  EXPECT_NE(failure->message.find("request_outstanding"), std::string::npos);

  auto view = harness.engine().build_job(second_job);
  ASSERT_TRUE(view.has_value());
  EXPECT_FALSE(view->signing_request.has_value());
  EXPECT_TRUE(harness.engine().verify_audit().intact);
}
