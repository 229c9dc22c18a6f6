#pragma once

#include <warden/schema/primitives.hpp>
#include <warden/schema/source_ref.hpp>

#include <vector>

namespace warden::build {

inline constexpr auto kSourceDomain = std::string_view{"warden.source.v1"};

/// Message the upstream maintainer signs for a pinned source revision.
warden::schema::hash32_t source_message(
    const warden::schema::source_ref_t& source);

/// True when the source carries a signature from a trusted signer that
/// verifies over source_message.
bool verify_source(const warden::schema::source_ref_t& source,
                   const std::vector<warden::schema::signer_id_t>& trusted);

}  // namespace warden::build
