#include <gtest/gtest.h>
#include <warden/schema/key/keyspace.hpp>
#include <warden/schema/signing_request.hpp>
#include <warden/suspension/controller.hpp>
#include <warden/testing/common.hpp>
#include <warden/testing/fixture.hpp>

#include <string>

namespace {

using warden::schema::error_code_t;
using warden::schema::suspension_action_t;
using warden::schema::suspension_subject_t;

constexpr auto kTokenTtlMs = warden::schema::duration_milliseconds_t{600000};

class suspension_fixture final : public warden::testing::store_fixture {
 public:
  explicit suspension_fixture(const std::string_view prefix)
      : store_fixture{prefix},
        controller_{encoder(),
                    storage(),
                    audit(),
                    warden::suspension::controller_options{
                        .authorities = {authority_.signer()},
                        .token_ttl_ms = kTokenTtlMs},
                    clock().source()} {}

  warden::suspension::controller& controller() { return controller_; }
  const warden::testing::voter& authority() const { return authority_; }

  warden::schema::authority_token_t token(
      const suspension_action_t action,
      const suspension_subject_t kind,
      const warden::schema::hash32_t& subject,
      const std::string& reason,
      const warden::testing::voter& signer) {
    auto out = warden::schema::authority_token_t{};
    out.action = action;
    out.subject_kind = kind;
    out.subject = subject;
    out.reason = reason;
    out.issued_at = clock().now();
    out.nonce = warden::testing::make_hash(next_nonce_++);
    out.authority = signer.signer();
    out.signature = warden::schema::signature_t{
        signer.key().sign(warden::suspension::token_message(out))};
    return out;
  }

  warden::schema::authority_token_t token(
      const suspension_action_t action,
      const suspension_subject_t kind,
      const warden::schema::hash32_t& subject,
      const std::string& reason) {
    return token(action, kind, subject, reason, authority_);
  }

 private:
  warden::testing::voter authority_;
  uint8_t next_nonce_{1};
  warden::suspension::controller controller_;
};

}  // namespace

TEST(suspension, suspend_and_unsuspend_artifact) {
  auto fixture = suspension_fixture{"warden_suspension_artifact"};
  auto digest = warden::testing::make_hash(10);

  auto suspended = fixture.controller().suspend(
      digest, "malware reported",
      fixture.token(suspension_action_t::suspend,
                    suspension_subject_t::artifact, digest,
                    "malware reported"));
  ASSERT_TRUE(suspended.ok()) << suspended.log;
  EXPECT_TRUE(fixture.controller().is_suspended(digest));
  EXPECT_FALSE(
      fixture.controller().is_suspended(warden::testing::make_hash(11)));

  auto entry = fixture.audit().get(suspended.value->audit_sequence);
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->type, warden::schema::audit_event_type_t::suspended);

  fixture.clock().advance(1000);
  auto lifted = fixture.controller().unsuspend(
      digest, "false positive",
      fixture.token(suspension_action_t::unsuspend,
                    suspension_subject_t::artifact, digest, "false positive"));
  ASSERT_TRUE(lifted.ok()) << lifted.log;
  EXPECT_FALSE(fixture.controller().is_suspended(digest));

  auto history =
      fixture.controller().history(suspension_subject_t::artifact, digest);
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[0].action, suspension_action_t::suspend);
  EXPECT_EQ(history[0].reason, "malware reported");
  EXPECT_EQ(history[1].action, suspension_action_t::unsuspend);
  EXPECT_LT(history[0].audit_sequence, history[1].audit_sequence);
  EXPECT_TRUE(fixture.audit().verify_chain().intact);
}

TEST(suspension, state_transitions_are_checked) {
  auto fixture = suspension_fixture{"warden_suspension_state"};
  auto digest = warden::testing::make_hash(20);

  EXPECT_EQ(fixture.controller()
                .unsuspend(digest, "nothing to lift",
                           fixture.token(suspension_action_t::unsuspend,
                                         suspension_subject_t::artifact, digest,
                                         "nothing to lift"))
                .code,
            error_code_t::not_suspended);

  ASSERT_TRUE(fixture.controller()
                  .suspend(digest, "first",
                           fixture.token(suspension_action_t::suspend,
                                         suspension_subject_t::artifact,
                                         digest, "first"))
                  .ok());
  EXPECT_EQ(fixture.controller()
                .suspend(digest, "second",
                         fixture.token(suspension_action_t::suspend,
                                       suspension_subject_t::artifact, digest,
                                       "second"))
                .code,
            error_code_t::already_suspended);
}

TEST(suspension, tokens_are_single_use) {
  auto fixture = suspension_fixture{"warden_suspension_replay"};
  auto digest = warden::testing::make_hash(30);
  auto token = fixture.token(suspension_action_t::suspend,
                             suspension_subject_t::artifact, digest, "pulled");

  ASSERT_TRUE(fixture.controller().suspend(digest, "pulled", token).ok());
  ASSERT_TRUE(fixture.controller()
                  .unsuspend(digest, "restored",
                             fixture.token(suspension_action_t::unsuspend,
                                           suspension_subject_t::artifact,
                                           digest, "restored"))
                  .ok());

  EXPECT_EQ(fixture.controller().suspend(digest, "pulled", token).code,
            error_code_t::token_replayed);
  EXPECT_FALSE(fixture.controller().is_suspended(digest));
}

TEST(suspension, rejects_unauthorized_tokens) {
  auto fixture = suspension_fixture{"warden_suspension_unauthorized"};
  auto digest = warden::testing::make_hash(40);
  const auto tail = fixture.audit().tail_sequence();

  auto impostor = warden::testing::voter{};
  EXPECT_EQ(fixture.controller()
                .suspend(digest, "pulled",
                         fixture.token(suspension_action_t::suspend,
                                       suspension_subject_t::artifact, digest,
                                       "pulled", impostor))
                .code,
            error_code_t::suspension_unauthorized);

  auto other_subject = fixture.token(suspension_action_t::suspend,
                                     suspension_subject_t::artifact,
                                     warden::testing::make_hash(41), "pulled");
  EXPECT_EQ(fixture.controller().suspend(digest, "pulled", other_subject).code,
            error_code_t::suspension_unauthorized);

  auto other_reason = fixture.token(suspension_action_t::suspend,
                                    suspension_subject_t::artifact, digest,
                                    "pulled");
  EXPECT_EQ(fixture.controller().suspend(digest, "edited", other_reason).code,
            error_code_t::suspension_unauthorized);

  auto wrong_action = fixture.token(suspension_action_t::unsuspend,
                                    suspension_subject_t::artifact, digest,
                                    "pulled");
  EXPECT_EQ(fixture.controller().suspend(digest, "pulled", wrong_action).code,
            error_code_t::suspension_unauthorized);

  auto forged = fixture.token(suspension_action_t::suspend,
                              suspension_subject_t::artifact, digest, "pulled");
  forged.nonce = warden::testing::make_hash(250);
  EXPECT_EQ(fixture.controller().suspend(digest, "pulled", forged).code,
            error_code_t::suspension_unauthorized);

  auto expired = fixture.token(suspension_action_t::suspend,
                               suspension_subject_t::artifact, digest,
                               "pulled");
  fixture.clock().advance(kTokenTtlMs + 1);
  EXPECT_EQ(fixture.controller().suspend(digest, "pulled", expired).code,
            error_code_t::suspension_unauthorized);

  EXPECT_FALSE(fixture.controller().is_suspended(digest));
  // every rejection is audited
  EXPECT_EQ(fixture.audit().tail_sequence(), tail + 6);
  auto last = fixture.audit().get(tail + 6);
  ASSERT_TRUE(last.has_value());
  EXPECT_EQ(last->type, warden::schema::audit_event_type_t::suspension_rejected);
}

TEST(suspension, application_suspension_covers_published_artifacts) {
  auto fixture = suspension_fixture{"warden_suspension_application"};
  auto digest = warden::testing::make_hash(50);
  auto app_id = std::string{"org.example.notes"};

  auto published = warden::schema::publication_record_t{};
  published.artifact_digest = digest;
  published.app_id = app_id;
  fixture.storage().put(fixture.encoder(),
                        warden::schema::key::make_publication_key(digest),
                        published);
  EXPECT_FALSE(fixture.controller().is_suspended(digest));

  auto subject = warden::suspension::application_subject(app_id);
  auto suspended = fixture.controller().suspend_application(
      app_id, "developer account compromised",
      fixture.token(suspension_action_t::suspend,
                    suspension_subject_t::application, subject,
                    "developer account compromised"));
  ASSERT_TRUE(suspended.ok()) << suspended.log;
  EXPECT_EQ(suspended.value->label, app_id);
  EXPECT_TRUE(fixture.controller().is_application_suspended(app_id));
  EXPECT_TRUE(fixture.controller().is_suspended(digest));
  EXPECT_FALSE(fixture.controller().is_application_suspended("org.example.other"));

  ASSERT_TRUE(fixture.controller()
                  .unsuspend_application(
                      app_id, "keys rotated",
                      fixture.token(suspension_action_t::unsuspend,
                                    suspension_subject_t::application, subject,
                                    "keys rotated"))
                  .ok());
  EXPECT_FALSE(fixture.controller().is_suspended(digest));
  EXPECT_EQ(fixture.controller()
                .history(suspension_subject_t::application, subject)
                .size(),
            2u);
}
