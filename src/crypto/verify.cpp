#include <warden/crypto/verify.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>

#include <array>
#include <memory>
#include <optional>
#include <vector>

namespace warden::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

evp_pkey_ptr make_public_key(const warden::schema::ed25519_signer_id& signer) {
  return evp_pkey_ptr{EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                                  signer.public_key.data(),
                                                  signer.public_key.size()),
                      EVP_PKEY_free};
}

evp_pkey_ptr make_public_key(
    const warden::schema::secp256k1_signer_id& signer) {
  auto ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_fromdata_init(ctx.get()) != 1) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }
  auto* group_name = const_cast<char*>("secp256k1");
  auto params =
      std::array{OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
                                                  group_name, 0),
                 OSSL_PARAM_construct_octet_string(
                     OSSL_PKEY_PARAM_PUB_KEY,
                     const_cast<unsigned char*>(signer.public_key.data()),
                     signer.public_key.size()),
                 OSSL_PARAM_construct_end()};
  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(ctx.get(), &raw_pkey, EVP_PKEY_PUBLIC_KEY,
                        params.data()) != 1) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }
  return evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
}

bool digest_verify(EVP_PKEY* pkey,
                   const EVP_MD* md,
                   const warden::schema::bytes_view_t& signature,
                   const warden::schema::bytes_view_t& message) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx ||
      EVP_DigestVerifyInit(ctx.get(), nullptr, md, nullptr, pkey) != 1) {
    return false;
  }
  return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
}

// 65-byte secp256k1 signatures arrive as [v || r || s] or [r || s || v];
// the recovery byte is 0..3 or 27+. Returns DER for OpenSSL.
std::optional<std::vector<uint8_t>> secp_signature_to_der(
    const warden::schema::secp256k1_signature_t& signature) {
  auto offset = std::size_t{0};
  if (signature[0] <= 3 || signature[0] >= 27) {
    offset = 1;
  } else if (signature[64] > 3 && signature[64] < 27) {
    return std::nullopt;
  }

  auto ecdsa_sig = ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
  auto r = bignum_ptr{BN_bin2bn(signature.data() + offset, 32, nullptr),
                      BN_free};
  auto s = bignum_ptr{BN_bin2bn(signature.data() + offset + 32, 32, nullptr),
                      BN_free};
  if (!ecdsa_sig || !r || !s ||
      ECDSA_SIG_set0(ecdsa_sig.get(), r.release(), s.release()) != 1) {
    return std::nullopt;
  }

  auto der_len = i2d_ECDSA_SIG(ecdsa_sig.get(), nullptr);
  if (der_len <= 0) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(static_cast<size_t>(der_len));
  auto* der_ptr = der.data();
  i2d_ECDSA_SIG(ecdsa_sig.get(), &der_ptr);
  return der;
}

}  // namespace

bool available() {
  static const auto available_now = [] {
    auto ed25519 = evp_pkey_ctx_ptr{
        EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), EVP_PKEY_CTX_free};
    auto ec = evp_pkey_ctx_ptr{
        EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
    return ed25519 != nullptr && ec != nullptr;
  }();
  return available_now;
}

bool verify_signature(const warden::schema::bytes_view_t& message,
                      const warden::schema::signer_id_t& signer,
                      const warden::schema::signature_t& signature) {
  return std::visit(
      overloaded{
          [&](const warden::schema::ed25519_signer_id& value) {
            const auto* raw =
                std::get_if<warden::schema::ed25519_signature_t>(&signature);
            if (raw == nullptr) {
              return false;
            }
            auto pkey = make_public_key(value);
            return pkey != nullptr &&
                   digest_verify(pkey.get(), nullptr, *raw, message);
          },
          [&](const warden::schema::secp256k1_signer_id& value) {
            const auto* raw =
                std::get_if<warden::schema::secp256k1_signature_t>(&signature);
            if (raw == nullptr) {
              return false;
            }
            auto der = secp_signature_to_der(*raw);
            auto pkey = make_public_key(value);
            return der.has_value() && pkey != nullptr &&
                   digest_verify(pkey.get(), EVP_sha256(),
                                 warden::schema::make_bytes_view(*der),
                                 message);
          }},
      signer);
}

}  // namespace warden::crypto
