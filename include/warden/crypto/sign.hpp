#pragma once

#include <warden/schema/primitives.hpp>

#include <openssl/types.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace warden::crypto {

/// Ed25519 key held by a human authorizer, source signer or suspension
/// authority. Never used for artifact signing; that happens inside the HSM.
class ed25519_key final {
 public:
  static std::optional<ed25519_key> generate();
  static std::optional<ed25519_key> from_pem(
      const std::filesystem::path& path,
      const std::string& passphrase = {});

  bool write_pem(const std::filesystem::path& path) const;

  warden::schema::ed25519_signer_id public_key() const;
  warden::schema::signer_id_t signer() const;
  warden::schema::ed25519_signature_t sign(
      const warden::schema::bytes_view_t& message) const;

 private:
  explicit ed25519_key(std::shared_ptr<EVP_PKEY> key);

  std::shared_ptr<EVP_PKEY> key_;
};

}  // namespace warden::crypto
