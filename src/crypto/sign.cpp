#include <warden/common/critical.hpp>
#include <warden/crypto/sign.hpp>

#include <openssl/evp.h>
#include <openssl/pem.h>

#include <utility>

namespace warden::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using bio_ptr = std::unique_ptr<BIO, decltype(&BIO_free)>;

}  // namespace

ed25519_key::ed25519_key(std::shared_ptr<EVP_PKEY> key)
    : key_{std::move(key)} {}

std::optional<ed25519_key> ed25519_key::generate() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  auto* raw = static_cast<EVP_PKEY*>(nullptr);
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1 ||
      EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
    return std::nullopt;
  }
  return ed25519_key{std::shared_ptr<EVP_PKEY>{raw, EVP_PKEY_free}};
}

std::optional<ed25519_key> ed25519_key::from_pem(
    const std::filesystem::path& path,
    const std::string& passphrase) {
  auto bio = bio_ptr{BIO_new_file(path.c_str(), "r"), BIO_free};
  if (!bio) {
    return std::nullopt;
  }
  auto* raw = PEM_read_bio_PrivateKey(
      bio.get(), nullptr, nullptr,
      passphrase.empty() ? nullptr : const_cast<char*>(passphrase.c_str()));
  if (raw == nullptr) {
    return std::nullopt;
  }
  auto key = std::shared_ptr<EVP_PKEY>{raw, EVP_PKEY_free};
  if (EVP_PKEY_get_id(key.get()) != EVP_PKEY_ED25519) {
    return std::nullopt;
  }
  return ed25519_key{std::move(key)};
}

bool ed25519_key::write_pem(const std::filesystem::path& path) const {
  auto bio = bio_ptr{BIO_new_file(path.c_str(), "w"), BIO_free};
  return bio && PEM_write_bio_PrivateKey(bio.get(), key_.get(), nullptr,
                                         nullptr, 0, nullptr, nullptr) == 1;
}

warden::schema::ed25519_signer_id ed25519_key::public_key() const {
  auto out = warden::schema::ed25519_signer_id{};
  auto length = out.public_key.size();
  if (EVP_PKEY_get_raw_public_key(key_.get(), out.public_key.data(),
                                  &length) != 1 ||
      length != out.public_key.size()) {
    warden::common::critical("failed to read Ed25519 public key");
  }
  return out;
}

warden::schema::signer_id_t ed25519_key::signer() const {
  return warden::schema::signer_id_t{public_key()};
}

warden::schema::ed25519_signature_t ed25519_key::sign(
    const warden::schema::bytes_view_t& message) const {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  auto signature = warden::schema::ed25519_signature_t{};
  auto length = signature.size();
  if (!ctx ||
      EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) !=
          1 ||
      EVP_DigestSign(ctx.get(), signature.data(), &length, message.data(),
                     message.size()) != 1 ||
      length != signature.size()) {
    warden::common::critical("Ed25519 signing failed");
  }
  return signature;
}

}  // namespace warden::crypto
