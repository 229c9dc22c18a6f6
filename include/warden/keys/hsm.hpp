#pragma once

#include <warden/schema/key_record.hpp>
#include <warden/schema/outcome.hpp>
#include <warden/schema/primitives.hpp>

#include <openssl/types.h>

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace warden::keys {

struct openssl_hsm_tag {};

/// Hardware security boundary. Implementations expose opaque handles and
/// signing only; nothing in this interface can carry private key bytes.
template <typename Library>
class hsm;

struct hsm_options final {
  // empty keeps keys in process memory only
  std::filesystem::path token_dir;
  std::string pin;
};

/// Software token on OpenSSL EVP keys. Ed25519 keys are generated inside the
/// token; with a token directory they are persisted as PIN-encrypted PKCS#8
/// and reloaded on start.
template <>
class hsm<openssl_hsm_tag> final {
 public:
  explicit hsm(hsm_options options);

  hsm(const hsm&) = delete;
  hsm& operator=(const hsm&) = delete;

  bool connected() const;
  void connect();
  void disconnect();

  warden::schema::outcome<warden::schema::key_handle_t> generate();
  warden::schema::outcome<warden::schema::ed25519_signer_id> public_key(
      const warden::schema::key_handle_t& handle) const;
  warden::schema::outcome<warden::schema::ed25519_signature_t> sign(
      const warden::schema::key_handle_t& handle,
      const warden::schema::bytes_view_t& message) const;

 private:
  using key_ptr = std::shared_ptr<EVP_PKEY>;

  warden::schema::error_code_t availability() const;
  bool persist(const warden::schema::key_handle_t& handle, EVP_PKEY* key) const;
  void load_token();

  hsm_options options_;
  mutable std::mutex mutex_;
  bool connected_{true};
  bool pin_rejected_{false};
  std::map<warden::schema::key_handle_t, key_ptr> keys_;
};

}  // namespace warden::keys
