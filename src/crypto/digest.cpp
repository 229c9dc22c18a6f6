#include <warden/crypto/digest.hpp>

#include <warden/common/critical.hpp>

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <memory>

namespace warden::crypto {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

evp_md_ctx_ptr make_sha256_context() {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    warden::common::critical("failed to initialize SHA-256 context");
  }
  return ctx;
}

warden::schema::hash32_t finalize(EVP_MD_CTX* ctx) {
  auto output = warden::schema::hash32_t{};
  auto length = 0u;
  if (EVP_DigestFinal_ex(ctx, output.data(), &length) != 1 ||
      length != output.size()) {
    warden::common::critical("failed to finalize SHA-256 digest");
  }
  return output;
}

}  // namespace

warden::schema::hash32_t sha256(const warden::schema::bytes_view_t& bytes) {
  auto ctx = make_sha256_context();
  if (EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1) {
    warden::common::critical("failed to update SHA-256 digest");
  }
  return finalize(ctx.get());
}

std::optional<warden::schema::hash32_t> sha256_file(
    const std::filesystem::path& path) {
  auto input = std::ifstream{path, std::ios::binary};
  if (!input) {
    return std::nullopt;
  }
  auto ctx = make_sha256_context();
  auto buffer = std::array<char, 64 * 1024>{};
  while (input) {
    input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto count = input.gcount();
    if (count > 0 &&
        EVP_DigestUpdate(ctx.get(), buffer.data(),
                         static_cast<std::size_t>(count)) != 1) {
      warden::common::critical("failed to update SHA-256 digest");
    }
  }
  if (input.bad()) {
    return std::nullopt;
  }
  return finalize(ctx.get());
}

}  // namespace warden::crypto
