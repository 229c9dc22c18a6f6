#include <gtest/gtest.h>
#include <warden/crypto/verify.hpp>
#include <warden/keys/manager.hpp>
#include <warden/schema/key/keyspace.hpp>
#include <warden/schema/signing_request.hpp>
#include <warden/testing/common.hpp>
#include <warden/testing/fixture.hpp>

#include <optional>
#include <string>

namespace {

using warden::schema::error_code_t;
using warden::schema::hash32_t;
using warden::schema::key_role_t;
using warden::schema::quorum_action_t;

/// Stores a signing request naming `key_id` and `digest` so that a proof for
/// it is accepted by the key manager.
hash32_t store_request(
    warden::testing::signing_fixture& fixture,
    const hash32_t& key_id,
    const hash32_t& digest,
    const uint8_t seed,
    std::optional<warden::schema::signing_state_t> state =
        std::nullopt) {
  auto request = warden::schema::signing_request_t{};
  request.request_id = warden::testing::make_hash(seed);
  request.artifact_digest = digest;
  request.key_id = key_id;
  request.app_id = "org.example.notes";
  request.threshold = 2;
  request.created_at = fixture.clock().now();
  request.state = state.value_or(warden::schema::authorized_t{
      .authorized_at = fixture.clock().now(), .last_failure = 0});
  fixture.storage().put(
      fixture.encoder(),
      warden::schema::key::make_signing_request_key(request.request_id),
      request);
  return request.request_id;
}

warden::schema::quorum_proof_t sign_proof(
    warden::testing::signing_fixture& fixture,
    const hash32_t& request_id,
    const hash32_t& digest) {
  return warden::testing::make_proof(
      quorum_action_t::sign_artifact, request_id, digest,
      {fixture.authorizers()[0], fixture.authorizers()[1]},
      fixture.clock().now());
}

warden::schema::quorum_proof_t revoke_proof(
    warden::testing::signing_fixture& fixture,
    const hash32_t& key_id) {
  return warden::testing::make_proof(
      quorum_action_t::revoke_key, key_id, key_id,
      {fixture.authorizers()[1], fixture.authorizers()[2]},
      fixture.clock().now());
}

}  // namespace

TEST(key_manager, builds_three_level_hierarchy) {
  auto fixture = warden::testing::signing_fixture{"warden_keys_hierarchy"};
  auto app = fixture.make_hierarchy("org.example.notes");

  ASSERT_TRUE(fixture.root_key().has_value());
  ASSERT_TRUE(fixture.repository_key().has_value());
  EXPECT_EQ(app.role, key_role_t::app_signing);
  EXPECT_EQ(app.parent_id, fixture.repository_key()->key_id);
  EXPECT_EQ(fixture.repository_key()->parent_id, fixture.root_key()->key_id);
  EXPECT_FALSE(fixture.root_key()->parent_id.has_value());
  EXPECT_EQ(app.app_id, std::optional<std::string>{"org.example.notes"});
  EXPECT_EQ(fixture.keys().list().size(), 3u);
  EXPECT_TRUE(fixture.keys().usable(app.key_id));

  auto stored = fixture.keys().get(app.key_id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->public_key, app.public_key);
  EXPECT_TRUE(fixture.audit().verify_chain().intact);
}

TEST(key_manager, enforces_hierarchy_rules) {
  auto fixture = warden::testing::signing_fixture{"warden_keys_rules"};
  auto app = fixture.make_hierarchy("org.example.notes");
  const auto root_id = fixture.root_key()->key_id;
  const auto repository_id = fixture.repository_key()->key_id;

  EXPECT_EQ(fixture.ceremony(key_role_t::root, std::nullopt, std::nullopt).code,
            error_code_t::root_exists);
  EXPECT_EQ(fixture.ceremony(key_role_t::app_signing, root_id,
                             std::string{"org.example.other"})
                .code,
            error_code_t::key_hierarchy_violation);
  EXPECT_EQ(fixture.ceremony(key_role_t::repository_signing, repository_id,
                             std::nullopt)
                .code,
            error_code_t::key_hierarchy_violation);
  EXPECT_EQ(fixture.ceremony(key_role_t::app_signing, repository_id,
                             std::nullopt)
                .code,
            error_code_t::key_hierarchy_violation);
  EXPECT_EQ(fixture.ceremony(key_role_t::app_signing, app.key_id,
                             std::string{"org.example.other"})
                .code,
            error_code_t::key_hierarchy_violation);
  EXPECT_EQ(fixture.ceremony(key_role_t::repository_signing,
                             warden::testing::make_hash(77), std::nullopt)
                .code,
            error_code_t::key_missing);
  EXPECT_EQ(fixture.keys().list().size(), 3u);
}

TEST(key_manager, ceremony_requires_every_participant) {
  auto fixture = warden::testing::signing_fixture{"warden_keys_ceremony"};
  auto subject = warden::keys::manager::ceremony_subject(
      key_role_t::root, std::nullopt, std::nullopt);
  auto partial = warden::testing::make_proof(
      quorum_action_t::create_key, subject, subject,
      {fixture.participants()[0], fixture.participants()[1]},
      fixture.clock().now());

  auto created = fixture.keys().create_key(key_role_t::root, std::nullopt,
                                           std::nullopt, partial);
  EXPECT_EQ(created.code, error_code_t::authorization_mismatch);
  EXPECT_TRUE(fixture.keys().list().empty());

  // proof for a different role cannot be reused
  auto full = warden::testing::make_proof(quorum_action_t::create_key, subject,
                                          subject, fixture.participants(),
                                          fixture.clock().now());
  EXPECT_EQ(fixture.keys()
                .create_key(key_role_t::repository_signing, std::nullopt,
                            std::nullopt, full)
                .code,
            error_code_t::authorization_mismatch);
  EXPECT_TRUE(fixture.keys()
                  .create_key(key_role_t::root, std::nullopt, std::nullopt,
                              full)
                  .ok());
}

TEST(key_manager, signs_only_what_the_quorum_approved) {
  auto fixture = warden::testing::signing_fixture{"warden_keys_sign"};
  auto app = fixture.make_hierarchy("org.example.notes");
  auto digest = warden::testing::make_hash(40);
  auto request_id = store_request(fixture, app.key_id, digest, 50);

  auto signature =
      fixture.keys().sign(app.key_id, digest,
                          sign_proof(fixture, request_id, digest));
  ASSERT_TRUE(signature.ok());
  EXPECT_TRUE(
      fixture.keys().verify_signature(app.key_id, digest, *signature.value));
  EXPECT_FALSE(fixture.keys().verify_signature(
      app.key_id, warden::testing::make_hash(41), *signature.value));

  auto other_digest = warden::testing::make_hash(41);
  EXPECT_EQ(fixture.keys()
                .sign(app.key_id, other_digest,
                      sign_proof(fixture, request_id, digest))
                .code,
            error_code_t::authorization_mismatch);

  // a valid proof whose request names another key
  EXPECT_EQ(fixture.keys()
                .sign(fixture.repository_key()->key_id, digest,
                      sign_proof(fixture, request_id, digest))
                .code,
            error_code_t::authorization_mismatch);

  auto unknown_request = warden::testing::make_hash(99);
  EXPECT_EQ(fixture.keys()
                .sign(app.key_id, digest,
                      sign_proof(fixture, unknown_request, digest))
                .code,
            error_code_t::authorization_mismatch);

  auto single = warden::testing::make_proof(
      quorum_action_t::sign_artifact, request_id, digest,
      {fixture.authorizers()[0]}, fixture.clock().now());
  EXPECT_EQ(fixture.keys().sign(app.key_id, digest, single).code,
            error_code_t::authorization_mismatch);
}

TEST(key_manager, refuses_to_sign_for_request_not_authorized) {
  auto fixture = warden::testing::signing_fixture{"warden_keys_unauthorized"};
  auto app = fixture.make_hierarchy("org.example.notes");
  auto digest = warden::testing::make_hash(42);

  auto denied = store_request(
      fixture, app.key_id, digest, 51,
      warden::schema::denied_t{.denied_by = fixture.authorizers()[2].signer(),
                               .denied_at = fixture.clock().now()});
  EXPECT_EQ(fixture.keys()
                .sign(app.key_id, digest, sign_proof(fixture, denied, digest))
                .code,
            error_code_t::authorization_mismatch);

  auto pending = store_request(
      fixture, app.key_id, digest, 52,
      warden::schema::awaiting_quorum_t{
          .deadline = fixture.clock().now() + 60'000});
  EXPECT_EQ(fixture.keys()
                .sign(app.key_id, digest, sign_proof(fixture, pending, digest))
                .code,
            error_code_t::authorization_mismatch);
}

TEST(key_manager, revocation_cascades_to_descendants) {
  auto fixture = warden::testing::signing_fixture{"warden_keys_revoke"};
  auto app = fixture.make_hierarchy("org.example.notes");
  const auto repository_id = fixture.repository_key()->key_id;
  auto digest = warden::testing::make_hash(60);
  auto request_id = store_request(fixture, app.key_id, digest, 61);

  auto revoked =
      fixture.keys().revoke(repository_id, revoke_proof(fixture, repository_id));
  ASSERT_TRUE(revoked.ok());
  EXPECT_EQ(revoked.value->status, warden::schema::key_status_t::revoked);
  EXPECT_TRUE(revoked.value->revoked_at.has_value());

  EXPECT_FALSE(fixture.keys().usable(repository_id));
  EXPECT_FALSE(fixture.keys().usable(app.key_id));
  EXPECT_TRUE(fixture.keys().usable(fixture.root_key()->key_id));
  EXPECT_EQ(fixture.keys()
                .sign(app.key_id, digest,
                      sign_proof(fixture, request_id, digest))
                .code,
            error_code_t::key_revoked);
  EXPECT_FALSE(fixture.keys().find_signing_key("org.example.notes").has_value());

  EXPECT_EQ(fixture.keys()
                .revoke(repository_id, revoke_proof(fixture, repository_id))
                .code,
            error_code_t::key_revoked);
  EXPECT_EQ(fixture
                .ceremony(key_role_t::app_signing, repository_id,
                          std::string{"org.example.other"})
                .code,
            error_code_t::key_revoked);
}

TEST(key_manager, revocation_needs_a_quorum_for_that_key) {
  auto fixture = warden::testing::signing_fixture{"warden_keys_revoke_proof"};
  auto app = fixture.make_hierarchy("org.example.notes");

  auto wrong_key = revoke_proof(fixture, fixture.repository_key()->key_id);
  EXPECT_EQ(fixture.keys().revoke(app.key_id, wrong_key).code,
            error_code_t::authorization_mismatch);
  EXPECT_EQ(fixture.keys()
                .revoke(warden::testing::make_hash(5),
                        revoke_proof(fixture, warden::testing::make_hash(5)))
                .code,
            error_code_t::key_missing);
  EXPECT_TRUE(fixture.keys().usable(app.key_id));
}

TEST(key_manager, signing_fails_closed_without_hsm) {
  auto fixture = warden::testing::signing_fixture{"warden_keys_hsm"};
  auto app = fixture.make_hierarchy("org.example.notes");
  auto digest = warden::testing::make_hash(70);
  auto request_id = store_request(fixture, app.key_id, digest, 71);
  const auto tail = fixture.audit().tail_sequence();

  fixture.hsm().disconnect();
  auto signature = fixture.keys().sign(
      app.key_id, digest, sign_proof(fixture, request_id, digest));
  EXPECT_EQ(signature.code, error_code_t::hsm_unavailable);
  EXPECT_FALSE(signature.value.has_value());

  auto event = fixture.audit().get(tail + 1);
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->type, warden::schema::audit_event_type_t::hsm_unavailable);
  EXPECT_EQ(event->severity, warden::schema::audit_severity_t::critical);

  EXPECT_EQ(fixture.ceremony(key_role_t::app_signing,
                             fixture.repository_key()->key_id,
                             std::string{"org.example.other"})
                .code,
            error_code_t::hsm_unavailable);

  fixture.hsm().connect();
  EXPECT_TRUE(fixture.keys()
                  .sign(app.key_id, digest,
                        sign_proof(fixture, request_id, digest))
                  .ok());
}

TEST(key_manager, validity_window_follows_the_chain) {
  auto fixture = warden::testing::signing_fixture{"warden_keys_valid_at"};
  auto app = fixture.make_hierarchy("org.example.notes");
  const auto created = app.created_at;
  const auto repository_id = fixture.repository_key()->key_id;

  fixture.clock().advance(1000);
  EXPECT_TRUE(fixture.keys().valid_at(app.key_id, created + 500));
  EXPECT_FALSE(fixture.keys().valid_at(app.key_id, created - 1));

  ASSERT_TRUE(fixture.keys()
                  .revoke(repository_id, revoke_proof(fixture, repository_id))
                  .ok());
  const auto revoked_at = fixture.clock().now();
  EXPECT_TRUE(fixture.keys().valid_at(app.key_id, revoked_at - 1));
  EXPECT_FALSE(fixture.keys().valid_at(app.key_id, revoked_at));
  EXPECT_FALSE(
      fixture.keys().valid_at(warden::testing::make_hash(3), created));
}

TEST(key_manager, falls_back_to_repository_key) {
  auto fixture = warden::testing::signing_fixture{"warden_keys_fallback"};
  auto app = fixture.make_hierarchy("org.example.notes");

  auto own = fixture.keys().find_signing_key("org.example.notes");
  ASSERT_TRUE(own.has_value());
  EXPECT_EQ(own->key_id, app.key_id);

  auto shared = fixture.keys().find_signing_key("org.example.unkeyed");
  ASSERT_TRUE(shared.has_value());
  EXPECT_EQ(shared->key_id, fixture.repository_key()->key_id);

  ASSERT_TRUE(
      fixture.keys().revoke(app.key_id, revoke_proof(fixture, app.key_id)).ok());
  auto after = fixture.keys().find_signing_key("org.example.notes");
  ASSERT_TRUE(after.has_value());
  EXPECT_EQ(after->key_id, fixture.repository_key()->key_id);
}

TEST(hsm, token_directory_survives_restart) {
  auto dir = warden::testing::scoped_dir{"warden_hsm_token"};
  auto options =
      warden::keys::hsm_options{.token_dir = dir.path() / "token", .pin = "1234"};
  auto message = warden::schema::make_bytes(std::string{"digest"});

  auto handle = warden::schema::key_handle_t{};
  auto public_key = warden::schema::ed25519_signer_id{};
  {
    auto token = warden::keys::hsm<warden::keys::openssl_hsm_tag>{options};
    auto generated = token.generate();
    ASSERT_TRUE(generated.ok());
    handle = *generated.value;
    auto exported = token.public_key(handle);
    ASSERT_TRUE(exported.ok());
    public_key = *exported.value;
  }

  auto reopened = warden::keys::hsm<warden::keys::openssl_hsm_tag>{options};
  auto exported = reopened.public_key(handle);
  ASSERT_TRUE(exported.ok());
  EXPECT_EQ(*exported.value, public_key);
  auto signature =
      reopened.sign(handle, warden::schema::make_bytes_view(message));
  ASSERT_TRUE(signature.ok());
  EXPECT_TRUE(warden::crypto::verify_signature(
      warden::schema::make_bytes_view(message),
      warden::schema::signer_id_t{public_key},
      warden::schema::signature_t{*signature.value}));

  auto wrong_pin = warden::keys::hsm<warden::keys::openssl_hsm_tag>{
      warden::keys::hsm_options{.token_dir = dir.path() / "token",
                                .pin = "0000"}};
  EXPECT_EQ(wrong_pin.sign(handle, warden::schema::make_bytes_view(message)).code,
            error_code_t::hsm_auth_failed);
}
