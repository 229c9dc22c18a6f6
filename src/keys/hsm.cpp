#include <warden/keys/hsm.hpp>

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <spdlog/spdlog.h>

#include <system_error>
#include <utility>

using namespace warden::schema;

namespace warden::keys {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using bio_ptr = std::unique_ptr<BIO, decltype(&BIO_free)>;

inline constexpr auto kTokenExtension = std::string_view{".p8"};

}  // namespace

hsm<openssl_hsm_tag>::hsm(hsm_options options) : options_{std::move(options)} {
  if (!options_.token_dir.empty()) {
    auto ec = std::error_code{};
    std::filesystem::create_directories(options_.token_dir, ec);
    if (ec) {
      spdlog::error("HSM token directory '{}' unavailable: {}",
                    options_.token_dir.string(), ec.message());
      connected_ = false;
      return;
    }
    load_token();
  }
  spdlog::info("HSM token ready with {} key(s)", keys_.size());
}

void hsm<openssl_hsm_tag>::load_token() {
  for (const auto& entry :
       std::filesystem::directory_iterator{options_.token_dir}) {
    if (!entry.is_regular_file() ||
        entry.path().extension() != kTokenExtension) {
      continue;
    }
    auto handle = try_make_hash32(entry.path().stem().string());
    if (!handle) {
      continue;
    }
    auto bio = bio_ptr{BIO_new_file(entry.path().c_str(), "r"), BIO_free};
    if (!bio) {
      continue;
    }
    auto* raw = PEM_read_bio_PrivateKey(
        bio.get(), nullptr, nullptr, const_cast<char*>(options_.pin.c_str()));
    if (raw == nullptr) {
      spdlog::error("HSM refused PIN for key {}", to_hex(*handle));
      pin_rejected_ = true;
      continue;
    }
    keys_.emplace(*handle, key_ptr{raw, EVP_PKEY_free});
  }
}

error_code_t hsm<openssl_hsm_tag>::availability() const {
  if (!connected_) {
    return error_code_t::hsm_unavailable;
  }
  if (pin_rejected_) {
    return error_code_t::hsm_auth_failed;
  }
  return error_code_t::ok;
}

bool hsm<openssl_hsm_tag>::connected() const {
  auto lock = std::scoped_lock{mutex_};
  return connected_;
}

void hsm<openssl_hsm_tag>::connect() {
  auto lock = std::scoped_lock{mutex_};
  connected_ = true;
  spdlog::info("HSM connected");
}

void hsm<openssl_hsm_tag>::disconnect() {
  auto lock = std::scoped_lock{mutex_};
  connected_ = false;
  spdlog::warn("HSM disconnected");
}

bool hsm<openssl_hsm_tag>::persist(const key_handle_t& handle,
                                   EVP_PKEY* key) const {
  if (options_.token_dir.empty()) {
    return true;
  }
  auto path = options_.token_dir / (to_hex(handle) + std::string{kTokenExtension});
  auto bio = bio_ptr{BIO_new_file(path.c_str(), "w"), BIO_free};
  if (!bio) {
    return false;
  }
  return PEM_write_bio_PKCS8PrivateKey(
             bio.get(), key, EVP_aes_256_cbc(), nullptr, 0, nullptr,
             const_cast<char*>(options_.pin.c_str())) == 1;
}

outcome<key_handle_t> hsm<openssl_hsm_tag>::generate() {
  auto lock = std::scoped_lock{mutex_};
  if (auto code = availability(); code != error_code_t::ok) {
    return make_error<key_handle_t>(code, "HSM not available for keygen");
  }

  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  auto* raw = static_cast<EVP_PKEY*>(nullptr);
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1 ||
      EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
    return make_error<key_handle_t>(error_code_t::hsm_unavailable,
                                    "HSM key generation failed");
  }
  auto key = key_ptr{raw, EVP_PKEY_free};

  auto handle = key_handle_t{};
  if (RAND_bytes(handle.data(), static_cast<int>(handle.size())) != 1) {
    return make_error<key_handle_t>(error_code_t::hsm_unavailable,
                                    "HSM handle generation failed");
  }
  if (!persist(handle, key.get())) {
    return make_error<key_handle_t>(error_code_t::hsm_unavailable,
                                    "HSM could not persist key");
  }
  keys_.emplace(handle, std::move(key));
  return make_ok(handle);
}

outcome<ed25519_signer_id> hsm<openssl_hsm_tag>::public_key(
    const key_handle_t& handle) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = keys_.find(handle);
  if (it == keys_.end()) {
    return make_error<ed25519_signer_id>(error_code_t::key_missing,
                                         "unknown HSM handle");
  }
  auto out = ed25519_signer_id{};
  auto length = out.public_key.size();
  if (EVP_PKEY_get_raw_public_key(it->second.get(), out.public_key.data(),
                                  &length) != 1 ||
      length != out.public_key.size()) {
    return make_error<ed25519_signer_id>(error_code_t::hsm_unavailable,
                                         "HSM public key export failed");
  }
  return make_ok(out);
}

outcome<ed25519_signature_t> hsm<openssl_hsm_tag>::sign(
    const key_handle_t& handle,
    const bytes_view_t& message) const {
  auto key = key_ptr{};
  {
    auto lock = std::scoped_lock{mutex_};
    if (auto code = availability(); code != error_code_t::ok) {
      return make_error<ed25519_signature_t>(code, "HSM not available");
    }
    auto it = keys_.find(handle);
    if (it == keys_.end()) {
      return make_error<ed25519_signature_t>(error_code_t::key_missing,
                                             "unknown HSM handle");
    }
    key = it->second;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  auto signature = ed25519_signature_t{};
  auto length = signature.size();
  if (!ctx ||
      EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) !=
          1 ||
      EVP_DigestSign(ctx.get(), signature.data(), &length, message.data(),
                     message.size()) != 1 ||
      length != signature.size()) {
    return make_error<ed25519_signature_t>(error_code_t::hsm_unavailable,
                                           "HSM signing operation failed");
  }
  return make_ok(signature);
}

}  // namespace warden::keys
