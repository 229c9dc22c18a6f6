#include <warden/config/config.hpp>

#include <spdlog/spdlog.h>

#include <fstream>

using namespace warden::schema;
namespace po = boost::program_options;

namespace warden::config {

namespace {

std::vector<std::string> strings(const po::variables_map& variables,
                                 const std::string& name) {
  if (!variables.contains(name)) {
    return {};
  }
  return variables[name].as<std::vector<std::string>>();
}

}  // namespace

po::options_description make_options_description() {
  auto general = po::options_description{"General"};
  general.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(), "INI style configuration file")(
      "db-path", po::value<std::string>()->default_value("warden.db"),
      "RocksDB directory")(
      "grpc-address,g",
      po::value<std::string>()->default_value("127.0.0.1:8080"),
      "IP:Port for the gRPC service")(
      "log-file", po::value<std::string>()->default_value("warden.log"),
      "Log file")("log-level",
                  po::value<std::string>()->default_value("info"),
                  "trace, debug, info, warn, error or critical");

  auto build = po::options_description{"Build"};
  build.add_options()(
      "build.builder", po::value<std::vector<std::string>>()->composing(),
      "Builder identity (repeatable)")(
      "build.attempt-timeout-ms",
      po::value<uint64_t>()->default_value(600000),
      "Wall-clock limit per builder attempt")(
      "build.retry-budget", po::value<uint32_t>()->default_value(1),
      "Retries per builder after a failed or timed out attempt")(
      "build.job-deadline-ms", po::value<uint64_t>()->default_value(0),
      "Whole-job deadline, 0 derives it from timeout and retries")(
      "build.sandbox-root",
      po::value<std::string>()->default_value("sandboxes"),
      "Directory holding single-use sandboxes")(
      "build.recipes-dir", po::value<std::string>()->default_value("recipes"),
      "Directory of recipe executables")(
      "build.artifact-dir",
      po::value<std::string>()->default_value("artifacts"),
      "Content addressed artifact store")(
      "build.egress-proxy", po::value<std::string>()->default_value(""),
      "host:port that allowlisted recipe traffic is relayed to")(
      "build.require-signed-sources", po::value<bool>()->default_value(true),
      "Reject source references without a trusted signature")(
      "build.trusted-source-signer",
      po::value<std::vector<std::string>>()->composing(),
      "Source signer identity (repeatable)");

  auto quorum = po::options_description{"Quorum"};
  quorum.add_options()(
      "quorum.authorizer", po::value<std::vector<std::string>>()->composing(),
      "Authorizer identity (repeatable)")(
      "quorum.threshold", po::value<uint32_t>()->default_value(2),
      "Approvals required to sign")(
      "quorum.request-ttl-ms", po::value<uint64_t>()->default_value(86400000),
      "How long a signing request waits for quorum")(
      "quorum.vote-ttl-ms", po::value<uint64_t>()->default_value(3600000),
      "How long a vote stays valid")(
      "quorum.resubmission",
      po::value<std::string>()->default_value("rebuild"),
      "rebuild or reuse-decision")(
      "ceremony.participant",
      po::value<std::vector<std::string>>()->composing(),
      "Key ceremony participant (repeatable)")(
      "suspension.authority",
      po::value<std::vector<std::string>>()->composing(),
      "Suspension authority identity (repeatable)")(
      "suspension.token-ttl-ms", po::value<uint64_t>()->default_value(600000),
      "Maximum authority token age")(
      "hsm.token-dir", po::value<std::string>()->default_value(""),
      "HSM token directory, empty keeps keys in memory")(
      "hsm.pin", po::value<std::string>()->default_value(""), "HSM PIN");

  auto ceremony = po::options_description{"Key ceremony"};
  ceremony.add_options()("command",
                         po::value<std::string>()->default_value("serve"),
                         "serve|create-key|revoke-key|list-keys")(
      "role", po::value<std::string>()->default_value(""),
      "root|repository_signing|app_signing")(
      "parent", po::value<std::string>()->default_value(""),
      "parent key id hex")("app-id",
                           po::value<std::string>()->default_value(""),
                           "application bound to an app signing key")(
      "key-id", po::value<std::string>()->default_value(""),
      "key id hex to revoke")(
      "vote", po::value<std::vector<std::string>>()->composing(),
      "vote file (repeatable)");

  auto all = po::options_description{"Warden"};
  all.add(general).add(build).add(quorum).add(ceremony);
  return all;
}

outcome<std::vector<signer_id_t>> parse_signers(
    const std::vector<std::string>& values,
    const std::string& option) {
  auto signers = std::vector<signer_id_t>{};
  for (const auto& value : values) {
    auto signer = try_parse_signer(value);
    if (!signer) {
      return make_error<std::vector<signer_id_t>>(
          error_code_t::invalid_request,
          "invalid signer '" + value + "' for " + option);
    }
    signers.push_back(*signer);
  }
  return make_ok(std::move(signers));
}

outcome<daemon_config> from_variables(const po::variables_map& variables) {
  auto config = daemon_config{};
  config.show_help = variables.contains("help");
  config.db_path = variables["db-path"].as<std::string>();
  config.grpc_address = variables["grpc-address"].as<std::string>();
  config.log_file = variables["log-file"].as<std::string>();
  config.log_level = variables["log-level"].as<std::string>();
  config.command = variables["command"].as<std::string>();
  config.ceremony.role = variables["role"].as<std::string>();
  config.ceremony.parent = variables["parent"].as<std::string>();
  config.ceremony.app_id = variables["app-id"].as<std::string>();
  config.ceremony.key_id = variables["key-id"].as<std::string>();
  config.ceremony.votes = strings(variables, "vote");
  if (config.show_help) {
    return make_ok(std::move(config));
  }

  auto& engine = config.engine;
  engine.sandbox_root = variables["build.sandbox-root"].as<std::string>();
  engine.artifact_dir = variables["build.artifact-dir"].as<std::string>();
  engine.build.builders = strings(variables, "build.builder");
  engine.build.attempt_timeout_ms =
      variables["build.attempt-timeout-ms"].as<uint64_t>();
  engine.build.retry_budget = variables["build.retry-budget"].as<uint32_t>();
  engine.build.job_deadline_ms =
      variables["build.job-deadline-ms"].as<uint64_t>();
  engine.build.require_signed_sources =
      variables["build.require-signed-sources"].as<bool>();

  config.executor.recipes_dir = variables["build.recipes-dir"].as<std::string>();
  config.executor.egress_proxy =
      variables["build.egress-proxy"].as<std::string>();

  auto source_signers = parse_signers(
      strings(variables, "build.trusted-source-signer"),
      "build.trusted-source-signer");
  auto authorizers =
      parse_signers(strings(variables, "quorum.authorizer"), "quorum.authorizer");
  auto participants = parse_signers(strings(variables, "ceremony.participant"),
                                    "ceremony.participant");
  auto authorities = parse_signers(strings(variables, "suspension.authority"),
                                   "suspension.authority");
  for (const auto* parsed :
       {&source_signers, &authorizers, &participants, &authorities}) {
    if (!parsed->ok()) {
      return make_error<daemon_config>(parsed->code, parsed->log);
    }
  }
  engine.build.trusted_source_signers = *source_signers.value;

  auto resubmission = try_from_string<resubmission_policy_t>(
      variables["quorum.resubmission"].as<std::string>());
  if (!resubmission) {
    return make_error<daemon_config>(
        error_code_t::invalid_request,
        "quorum.resubmission must be rebuild or reuse-decision");
  }

  auto quorum = warden::keys::quorum_policy_t{
      .authorizers = *authorizers.value,
      .threshold = variables["quorum.threshold"].as<uint32_t>(),
      .vote_ttl_ms = variables["quorum.vote-ttl-ms"].as<uint64_t>()};
  if (quorum.threshold == 0 || quorum.threshold > quorum.authorizers.size()) {
    return make_error<daemon_config>(
        error_code_t::invalid_request,
        "quorum.threshold must be between 1 and the number of authorizers");
  }
  if (participants.value->empty()) {
    return make_error<daemon_config>(
        error_code_t::invalid_request,
        "at least one ceremony.participant is required");
  }

  engine.signing.quorum = quorum;
  engine.signing.request_ttl_ms =
      variables["quorum.request-ttl-ms"].as<uint64_t>();
  engine.signing.resubmission = *resubmission;
  engine.keys.signing_quorum = quorum;
  engine.keys.ceremony_participants = *participants.value;
  engine.suspension.authorities = *authorities.value;
  engine.suspension.token_ttl_ms =
      variables["suspension.token-ttl-ms"].as<uint64_t>();
  engine.hsm.token_dir = variables["hsm.token-dir"].as<std::string>();
  engine.hsm.pin = variables["hsm.pin"].as<std::string>();

  if (config.command != "serve" && config.command != "create-key" &&
      config.command != "revoke-key" && config.command != "list-keys") {
    return make_error<daemon_config>(error_code_t::invalid_request,
                                     "unknown command " + config.command);
  }
  if (engine.build.builders.size() < 3) {
    spdlog::warn("Only {} builder identities configured",
                 engine.build.builders.size());
  }
  return make_ok(std::move(config));
}

outcome<daemon_config> parse(const int argc, const char* const argv[]) {
  auto description = make_options_description();
  auto variables = po::variables_map{};
  try {
    auto positional = po::positional_options_description{};
    positional.add("command", 1);
    po::store(po::command_line_parser(argc, argv)
                  .options(description)
                  .positional(positional)
                  .run(),
              variables);
    if (variables.contains("config")) {
      auto path = variables["config"].as<std::string>();
      auto input = std::ifstream{path};
      if (!input.good()) {
        return make_error<daemon_config>(error_code_t::invalid_request,
                                         "cannot open config file " + path);
      }
      po::store(po::parse_config_file(input, description), variables);
    }
    po::notify(variables);
  } catch (const po::error& e) {
    return make_error<daemon_config>(error_code_t::invalid_request, e.what());
  }
  return from_variables(variables);
}

}  // namespace warden::config
