#include <warden/keys/vote_file.hpp>

#include <boost/program_options.hpp>

#include <fstream>
#include <string>

using namespace warden::schema;
namespace po = boost::program_options;

namespace warden::keys {

namespace {

outcome<authorization_record_t> malformed(const std::string& field) {
  return make_error<authorization_record_t>(error_code_t::invalid_request,
                                            "vote field '" + field +
                                                "' missing or malformed");
}

po::options_description vote_description() {
  auto description = po::options_description{"vote"};
  description.add_options()("action", po::value<std::string>())(
      "request_id", po::value<std::string>())(
      "digest", po::value<std::string>())(
      "decision", po::value<std::string>())(
      "authorizer", po::value<std::string>())(
      "authorized_at", po::value<uint64_t>())(
      "signature", po::value<std::string>());
  return description;
}

std::string field(const po::variables_map& variables, const char* name) {
  return variables.count(name) ? variables[name].as<std::string>()
                               : std::string{};
}

}  // namespace

outcome<authorization_record_t> parse_vote(std::istream& input) {
  const auto description = vote_description();
  auto variables = po::variables_map{};
  try {
    po::store(po::parse_config_file(input, description), variables);
    po::notify(variables);
  } catch (const po::error& e) {
    return make_error<authorization_record_t>(
        error_code_t::invalid_request, std::string{"malformed vote: "} + e.what());
  }

  auto action = try_from_string<quorum_action_t>(field(variables, "action"));
  if (!action) {
    return malformed("action");
  }
  auto request_id = try_make_hash32(field(variables, "request_id"));
  if (!request_id) {
    return malformed("request_id");
  }
  auto digest = try_make_hash32(field(variables, "digest"));
  if (!digest) {
    return malformed("digest");
  }
  auto decision =
      try_from_string<authorization_decision_t>(field(variables, "decision"));
  if (!decision) {
    return malformed("decision");
  }
  auto authorizer = try_parse_signer(field(variables, "authorizer"));
  if (!authorizer) {
    return malformed("authorizer");
  }
  auto signature = try_parse_signature(field(variables, "signature"));
  if (!signature) {
    return malformed("signature");
  }
  if (!variables.count("authorized_at")) {
    return malformed("authorized_at");
  }

  auto record = authorization_record_t{};
  record.action = *action;
  record.request_id = *request_id;
  record.bound_digest = *digest;
  record.decision = *decision;
  record.authorizer = *authorizer;
  record.authorized_at = variables["authorized_at"].as<uint64_t>();
  record.signature = *signature;
  return make_ok(record);
}

outcome<authorization_record_t> load_vote(const std::filesystem::path& path) {
  auto input = std::ifstream{path};
  if (!input.good()) {
    return make_error<authorization_record_t>(
        error_code_t::not_found, "cannot open vote file " + path.string());
  }
  return parse_vote(input);
}

}  // namespace warden::keys
