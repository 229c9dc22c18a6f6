#pragma once

#include <warden/schema/primitives.hpp>

#include <filesystem>
#include <optional>

namespace warden::crypto {

/// SHA-256 content digest. Artifact identity across the whole system.
warden::schema::hash32_t sha256(const warden::schema::bytes_view_t& bytes);

/// Streams the file through SHA-256. nullopt when it cannot be read.
std::optional<warden::schema::hash32_t> sha256_file(
    const std::filesystem::path& path);

}  // namespace warden::crypto
