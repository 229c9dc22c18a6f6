#include <warden/blake3/hash.hpp>
#include <warden/schema/key/builder.hpp>

#include <algorithm>
#include <iterator>
#include <ranges>

using namespace warden::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const signer_id_t& signer_id) {
  std::visit(overloaded{[this](const ed25519_signer_id& arg) {
                          write(uint8_t{0});
                          write(std::span(arg.public_key));
                        },
                        [this](const secp256k1_signer_id& arg) {
                          write(uint8_t{1});
                          write(std::span(arg.public_key));
                        }},
             signer_id);
  return *this;
}

builder& builder::hash(const std::string_view& str) {
  auto digest = warden::blake3::hash(str);
  std::ranges::copy(digest, std::back_inserter(data));
  return *this;
}
