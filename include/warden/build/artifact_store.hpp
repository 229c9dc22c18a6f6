#pragma once

#include <warden/schema/primitives.hpp>

#include <filesystem>
#include <optional>

namespace warden::build {

struct stored_blob_t final {
  warden::schema::hash32_t digest{};
  uint64_t size{};
};

/// Content-addressed blob store for artifacts and build logs. Blobs are
/// addressed by the hex SHA-256 of their bytes and never rewritten.
class artifact_store final {
 public:
  explicit artifact_store(std::filesystem::path root);

  /// Copy a file produced inside a sandbox into the store.
  std::optional<stored_blob_t> put_file(const std::filesystem::path& source);
  std::optional<stored_blob_t> put(const warden::schema::bytes_view_t& bytes);

  std::optional<warden::schema::bytes_t> read(
      const warden::schema::hash32_t& digest) const;
  bool contains(const warden::schema::hash32_t& digest) const;
  std::filesystem::path path_of(const warden::schema::hash32_t& digest) const;

 private:
  std::optional<stored_blob_t> install(const std::filesystem::path& staged,
                                       const warden::schema::hash32_t& digest);

  std::filesystem::path root_;
};

}  // namespace warden::build
