#include <warden/blake3/hash.hpp>
#include <warden/build/source.hpp>
#include <warden/crypto/verify.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>

#include <algorithm>
#include <tuple>

using namespace warden::schema;

namespace warden::build {

hash32_t source_message(const source_ref_t& source) {
  auto encoder = encoding::scale_encoder_t{};
  auto encoded =
      encoder.encode(std::tuple{source.locator, source.commit, source.tag});
  return warden::blake3::hash(kSourceDomain, encoded);
}

bool verify_source(const source_ref_t& source,
                   const std::vector<signer_id_t>& trusted) {
  if (!source.signer || !source.signature) {
    return false;
  }
  if (std::find(trusted.begin(), trusted.end(), *source.signer) ==
      trusted.end()) {
    return false;
  }
  auto message = source_message(source);
  return warden::crypto::verify_signature(message, *source.signer,
                                          *source.signature);
}

}  // namespace warden::build
