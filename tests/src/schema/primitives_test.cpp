#include <gtest/gtest.h>
#include <warden/schema/build_job.hpp>
#include <warden/schema/error_code.hpp>
#include <warden/schema/key/keyspace.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/signing_request.hpp>

#include <algorithm>

TEST(primitives, make_hash32_from_bytes_round_trips) {
  auto input = warden::schema::bytes_t(32, 0xAB);
  auto hash = warden::schema::make_hash32(input);
  EXPECT_EQ(hash.size(), 32u);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, try_make_hash32_decodes_prefixed_hex) {
  auto hash = warden::schema::try_make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  ASSERT_TRUE(hash.has_value());
  EXPECT_EQ((*hash)[0], 0x01);
  EXPECT_EQ((*hash)[31], 0x20);
  EXPECT_EQ(warden::schema::to_hex(*hash),
            "0102030405060708090a0b0c0d0e0f10"
            "1112131415161718191a1b1c1d1e1f20");
}

TEST(primitives, try_make_hash32_rejects_wrong_length_and_bad_digits) {
  EXPECT_FALSE(warden::schema::try_make_hash32("0102").has_value());
  EXPECT_FALSE(warden::schema::try_make_hash32(std::string(64, 'z')).has_value());
  EXPECT_FALSE(warden::schema::try_from_hex("abc").has_value());
}

TEST(primitives, make_zero_hash_returns_zero_bytes) {
  auto zero = warden::schema::make_zero_hash();
  for (auto byte : zero) {
    EXPECT_EQ(byte, 0u);
  }
}

TEST(primitives, signer_text_round_trips) {
  auto signer = warden::schema::signer_id_t{warden::schema::ed25519_signer_id{}};
  std::get<warden::schema::ed25519_signer_id>(signer).public_key[0] = 0x42;
  auto text = warden::schema::to_string(signer);
  EXPECT_TRUE(text.starts_with("ed25519:42"));
  auto parsed = warden::schema::try_parse_signer(text);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, signer);
  EXPECT_FALSE(warden::schema::try_parse_signer("rsa:00").has_value());
  EXPECT_FALSE(warden::schema::try_parse_signer("ed25519:00").has_value());
}

TEST(primitives, try_parse_signature_accepts_both_curves) {
  auto ed = warden::schema::try_parse_signature(std::string(128, 'a'));
  ASSERT_TRUE(ed.has_value());
  EXPECT_TRUE(std::holds_alternative<warden::schema::ed25519_signature_t>(*ed));
  auto secp = warden::schema::try_parse_signature(std::string(130, 'b'));
  ASSERT_TRUE(secp.has_value());
  EXPECT_TRUE(
      std::holds_alternative<warden::schema::secp256k1_signature_t>(*secp));
  EXPECT_FALSE(warden::schema::try_parse_signature(std::string(10, 'c')).has_value());
}

TEST(primitives, enum_names_round_trip) {
  using namespace warden::schema;
  EXPECT_EQ(to_string(error_code_t::resubmission_requires_rebuild),
            "resubmission_requires_rebuild");
  EXPECT_EQ(to_string(job_state_t::timed_out), "timed_out");
  EXPECT_EQ(try_from_string<resubmission_policy_t>("reuse-decision"),
            resubmission_policy_t::reuse_decision);
  EXPECT_FALSE(try_from_string<resubmission_policy_t>("sometimes").has_value());
  EXPECT_EQ(try_from_string<quorum_action_t>("revoke_key"),
            quorum_action_t::revoke_key);
  EXPECT_TRUE(is_terminal(job_state_t::rejected));
  EXPECT_FALSE(is_terminal(job_state_t::building));
}

TEST(primitives, signing_state_maps_to_quorum_view) {
  using namespace warden::schema;
  EXPECT_EQ(quorum_state_of(awaiting_quorum_t{}), quorum_state_t::pending);
  EXPECT_EQ(quorum_state_of(signed_t{}), quorum_state_t::reached);
  EXPECT_EQ(quorum_state_of(expired_t{}), quorum_state_t::expired);
  EXPECT_EQ(to_string(signing_state_t{authorized_t{}}), "authorized");
}

TEST(primitives, result_keys_sort_by_builder_then_attempt) {
  auto job = warden::schema::make_zero_hash();
  auto first = warden::schema::key::make_result_key(job, 0, 2);
  auto second = warden::schema::key::make_result_key(job, 1, 1);
  auto third = warden::schema::key::make_result_key(job, 1, 2);
  EXPECT_LT(first, second);
  EXPECT_LT(second, third);
  auto prefix = warden::schema::key::make_result_prefix_key(job);
  EXPECT_TRUE(std::equal(prefix.begin(), prefix.end(), first.begin()));
}

TEST(primitives, audit_keys_sort_by_sequence) {
  EXPECT_LT(warden::schema::key::make_audit_entry_key(255),
            warden::schema::key::make_audit_entry_key(256));
}
