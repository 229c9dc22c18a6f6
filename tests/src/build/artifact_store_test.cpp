#include <gtest/gtest.h>
#include <warden/build/artifact_store.hpp>
#include <warden/build/source.hpp>
#include <warden/crypto/digest.hpp>
#include <warden/testing/common.hpp>

#include <fstream>

TEST(artifact_store, content_addresses_by_sha256) {
  auto dir = warden::testing::scoped_dir{"warden_store_put"};
  auto store = warden::build::artifact_store{dir.path()};

  auto bytes = warden::schema::make_bytes(std::string{"APK\x01\x02\x03"});
  auto stored = store.put(warden::schema::make_bytes_view(bytes));
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->digest,
            warden::crypto::sha256(warden::schema::make_bytes_view(bytes)));
  EXPECT_EQ(stored->size, bytes.size());
  EXPECT_TRUE(store.contains(stored->digest));
  auto read = store.read(stored->digest);
  ASSERT_TRUE(read.has_value());
  EXPECT_EQ(*read, bytes);

  auto again = store.put(warden::schema::make_bytes_view(bytes));
  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(again->digest, stored->digest);
}

TEST(artifact_store, put_file_copies_out_of_the_sandbox) {
  auto dir = warden::testing::scoped_dir{"warden_store_file"};
  auto store = warden::build::artifact_store{dir.path() / "store"};
  auto source = dir.path() / "artifact";
  {
    auto out = std::ofstream{source, std::ios::binary};
    out << "release build";
  }

  auto stored = store.put_file(source);
  ASSERT_TRUE(stored.has_value());
  std::filesystem::remove(source);

  auto read = store.read(stored->digest);
  ASSERT_TRUE(read.has_value());
  EXPECT_EQ(warden::schema::make_string(warden::schema::make_bytes_view(*read)),
            "release build");
  EXPECT_FALSE(store.put_file(dir.path() / "missing").has_value());
  EXPECT_FALSE(store.read(warden::testing::make_hash(1)).has_value());
}

TEST(source_verification, requires_trusted_valid_signature) {
  auto maintainer = warden::testing::voter{};
  auto stranger = warden::testing::voter{};
  auto job = warden::testing::make_job("org.example.notes", 3, 3);

  EXPECT_FALSE(warden::build::verify_source(job.source, {maintainer.signer()}));

  warden::testing::sign_source(job.source, maintainer);
  EXPECT_TRUE(warden::build::verify_source(job.source, {maintainer.signer()}));
  EXPECT_FALSE(warden::build::verify_source(job.source, {stranger.signer()}));

  auto moved = job.source;
  moved.commit = "fedcba9876543210";
  EXPECT_FALSE(warden::build::verify_source(moved, {maintainer.signer()}));
}
