#pragma once

#include <warden/schema/authorization_record.hpp>
#include <warden/schema/outcome.hpp>

#include <filesystem>
#include <istream>

namespace warden::keys {

/// Reads the `key=value` vote printed by warden-authorize. Unknown or
/// repeated keys are rejected.
warden::schema::outcome<warden::schema::authorization_record_t> parse_vote(
    std::istream& input);

warden::schema::outcome<warden::schema::authorization_record_t> load_vote(
    const std::filesystem::path& path);

}  // namespace warden::keys
