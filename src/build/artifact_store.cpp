#include <warden/build/artifact_store.hpp>
#include <warden/crypto/digest.hpp>

#include <openssl/rand.h>
#include <spdlog/spdlog.h>

#include <array>
#include <fstream>
#include <iterator>
#include <system_error>

using namespace warden::schema;

namespace warden::build {

namespace {

std::filesystem::path staging_name(const std::filesystem::path& root) {
  auto nonce = std::array<uint8_t, 8>{};
  RAND_bytes(nonce.data(), static_cast<int>(nonce.size()));
  return root / "staging" / to_hex(nonce);
}

}  // namespace

artifact_store::artifact_store(std::filesystem::path root)
    : root_{std::move(root)} {
  auto ec = std::error_code{};
  std::filesystem::create_directories(root_ / "staging", ec);
  if (ec) {
    spdlog::error("Failed to create artifact store at '{}': {}",
                  root_.string(), ec.message());
  }
}

std::filesystem::path artifact_store::path_of(const hash32_t& digest) const {
  auto hex = to_hex(digest);
  return root_ / hex.substr(0, 2) / hex;
}

bool artifact_store::contains(const hash32_t& digest) const {
  auto ec = std::error_code{};
  return std::filesystem::is_regular_file(path_of(digest), ec);
}

std::optional<stored_blob_t> artifact_store::install(
    const std::filesystem::path& staged,
    const hash32_t& digest) {
  auto ec = std::error_code{};
  auto target = path_of(digest);
  auto size = std::filesystem::file_size(staged, ec);
  if (ec) {
    std::filesystem::remove(staged, ec);
    return std::nullopt;
  }
  if (contains(digest)) {
    std::filesystem::remove(staged, ec);
    return stored_blob_t{.digest = digest, .size = size};
  }
  std::filesystem::create_directories(target.parent_path(), ec);
  if (!ec) {
    std::filesystem::rename(staged, target, ec);
  }
  if (ec) {
    spdlog::error("Failed to install blob {}: {}", to_hex(digest),
                  ec.message());
    std::filesystem::remove(staged, ec);
    return std::nullopt;
  }
  return stored_blob_t{.digest = digest, .size = size};
}

std::optional<stored_blob_t> artifact_store::put_file(
    const std::filesystem::path& source) {
  auto staged = staging_name(root_);
  auto ec = std::error_code{};
  std::filesystem::copy_file(source, staged, ec);
  if (ec) {
    spdlog::error("Failed to stage '{}': {}", source.string(), ec.message());
    return std::nullopt;
  }
  // hash the staged copy, not the sandbox file the recipe could still touch
  auto digest = warden::crypto::sha256_file(staged);
  if (!digest) {
    std::filesystem::remove(staged, ec);
    return std::nullopt;
  }
  return install(staged, *digest);
}

std::optional<stored_blob_t> artifact_store::put(const bytes_view_t& bytes) {
  auto staged = staging_name(root_);
  {
    auto output = std::ofstream{staged, std::ios::binary};
    output.write(reinterpret_cast<const char*>(bytes.data()),
                 static_cast<std::streamsize>(bytes.size()));
    if (!output) {
      return std::nullopt;
    }
  }
  return install(staged, warden::crypto::sha256(bytes));
}

std::optional<bytes_t> artifact_store::read(const hash32_t& digest) const {
  auto input = std::ifstream{path_of(digest), std::ios::binary};
  if (!input) {
    return std::nullopt;
  }
  auto bytes = bytes_t{std::istreambuf_iterator<char>{input},
                       std::istreambuf_iterator<char>{}};
  if (input.bad()) {
    return std::nullopt;
  }
  return bytes;
}

}  // namespace warden::build
