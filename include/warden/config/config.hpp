#pragma once

#include <warden/build/executor.hpp>
#include <warden/execution/engine.hpp>
#include <warden/schema/outcome.hpp>

#include <boost/program_options.hpp>

#include <string>
#include <vector>

namespace warden::config {

/// Offline key ceremony run against the database instead of serving.
struct ceremony_config final {
  std::string role;
  std::string parent;
  std::string app_id;
  std::string key_id;
  // files written by `warden-authorize ceremony` or `vote`
  std::vector<std::string> votes;
};

/// Everything the daemon needs to start.
struct daemon_config final {
  bool show_help{false};
  // serve, create-key, revoke-key or list-keys
  std::string command{"serve"};
  ceremony_config ceremony;
  std::string db_path{"warden.db"};
  std::string grpc_address{"127.0.0.1:8080"};
  std::string log_file{"warden.log"};
  std::string log_level{"info"};
  warden::build::process_executor_options executor;
  warden::execution::engine_options engine;
};

boost::program_options::options_description make_options_description();

/// Command line first, then `--config <file>` for anything not given on the
/// command line.
warden::schema::outcome<daemon_config> parse(int argc, const char* const argv[]);

/// Same as `parse` for an already stored variables map.
warden::schema::outcome<daemon_config> from_variables(
    const boost::program_options::variables_map& variables);

warden::schema::outcome<std::vector<warden::schema::signer_id_t>>
parse_signers(const std::vector<std::string>& values, const std::string& option);

}  // namespace warden::config
