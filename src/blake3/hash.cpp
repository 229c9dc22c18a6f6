#include <warden/blake3/hash.hpp>

#include <boost/endian/conversion.hpp>

namespace warden::blake3 {

hasher::hasher() {
  blake3_hasher_init(&state_);
}

hasher::hasher(const std::string_view& domain) : hasher() {
  auto length = boost::endian::native_to_big(
      static_cast<uint32_t>(domain.size()));
  blake3_hasher_update(&state_, &length, sizeof(length));
  blake3_hasher_update(&state_, domain.data(), domain.size());
}

hasher& hasher::update(const std::string_view& str) {
  blake3_hasher_update(&state_, str.data(), str.size());
  return *this;
}

hasher& hasher::update(const warden::schema::bytes_view_t& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

warden::schema::hash32_t hasher::finalize() const {
  // BLAKE3_OUT_LEN
  auto output = warden::schema::hash32_t{};
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

warden::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

warden::schema::hash32_t hash(const warden::schema::bytes_view_t& bytes) {
  return hasher{}.update(bytes).finalize();
}

warden::schema::hash32_t hash(const std::string_view& domain,
                              const warden::schema::bytes_view_t& bytes) {
  return hasher{domain}.update(bytes).finalize();
}

}  // namespace warden::blake3
