#include <boost/program_options.hpp>
#include <warden/build/source.hpp>
#include <warden/common/critical.hpp>
#include <warden/crypto/sign.hpp>
#include <warden/keys/manager.hpp>
#include <warden/keys/quorum.hpp>
#include <warden/suspension/controller.hpp>

#include <openssl/rand.h>

#include <chrono>
#include <iostream>
#include <optional>
#include <string>

using namespace warden::schema;

namespace {

namespace po = boost::program_options;

uint64_t now_ms() {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

hash32_t get_hash32(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    warden::common::critical("missing --" + name);
  }
  auto hash = try_make_hash32(vm[name].as<std::string>());
  if (!hash) {
    warden::common::critical("--" + name + " must be 32 bytes of hex");
  }
  return *hash;
}

std::string get_string(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    warden::common::critical("missing --" + name);
  }
  return vm[name].as<std::string>();
}

template <typename Enum>
Enum get_enum(const po::variables_map& vm, const std::string& name) {
  auto value = try_from_string<Enum>(get_string(vm, name));
  if (!value) {
    warden::common::critical("unsupported value for --" + name);
  }
  return *value;
}

warden::crypto::ed25519_key load_key(const po::variables_map& vm) {
  auto key = warden::crypto::ed25519_key::from_pem(
      get_string(vm, "key"), vm["passphrase"].as<std::string>());
  if (!key) {
    warden::common::critical("cannot load Ed25519 private key");
  }
  return *key;
}

uint64_t timestamp_or_now(const po::variables_map& vm,
                          const std::string& name) {
  return vm.contains(name) ? vm[name].as<uint64_t>() : now_ms();
}

hash32_t random_nonce() {
  auto nonce = hash32_t{};
  if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
    warden::common::critical("RAND_bytes failed");
  }
  return nonce;
}

void print_vote(const po::variables_map& vm,
                const quorum_action_t action,
                const hash32_t& subject) {
  auto key = load_key(vm);
  auto decision = get_enum<authorization_decision_t>(vm, "decision");
  auto request_id = get_hash32(vm, "request-id");
  auto authorized_at = timestamp_or_now(vm, "authorized-at");
  auto message = warden::keys::authorization_message(
      action, request_id, subject, decision, authorized_at);
  std::cout << "action=" << to_string(action) << '\n'
            << "request_id=" << to_hex(request_id) << '\n'
            << "digest=" << to_hex(subject) << '\n'
            << "decision=" << to_string(decision) << '\n'
            << "authorizer=" << to_string(key.signer()) << '\n'
            << "authorized_at=" << authorized_at << '\n'
            << "signature=" << to_hex(key.sign(message)) << '\n';
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  warden-authorize generate-key --key <pem>\n"
            << "  warden-authorize identity --key <pem>\n"
            << "  warden-authorize vote --key <pem> --request-id <hex> "
               "--digest <hex> --decision approve|deny\n"
            << "  warden-authorize ceremony --key <pem> --request-id <hex> "
               "--role <role> [--parent <hex>] [--app-id <id>]\n"
            << "  warden-authorize source --key <pem> --locator <url> "
               "--commit <rev> [--tag <tag>]\n"
            << "  warden-authorize token --key <pem> --token-action "
               "suspend|unsuspend --reason <text> (--artifact <hex> | "
               "--app-id <id>)\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"warden-authorize options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "generate-key|identity|vote|ceremony|source|token")(
      "key", po::value<std::string>(), "Ed25519 private key PEM")(
      "passphrase", po::value<std::string>()->default_value(""),
      "PEM passphrase")("request-id", po::value<std::string>(),
                        "signing request or ceremony id hex")(
      "digest", po::value<std::string>(), "artifact digest or key id hex")(
      "decision", po::value<std::string>()->default_value("approve"),
      "approve|deny")("action", po::value<std::string>(),
                      "sign_artifact|create_key|revoke_key")(
      "authorized-at", po::value<uint64_t>(), "vote time ms, default now")(
      "role", po::value<std::string>(),
      "root|repository_signing|app_signing")(
      "parent", po::value<std::string>(), "parent key id hex")(
      "app-id", po::value<std::string>(), "application id")(
      "locator", po::value<std::string>(), "source locator")(
      "commit", po::value<std::string>(), "source commit")(
      "tag", po::value<std::string>()->default_value(""), "source tag")(
      "token-action", po::value<std::string>(), "suspend|unsuspend")(
      "artifact", po::value<std::string>(), "artifact digest hex")(
      "reason", po::value<std::string>(), "suspension reason")(
      "issued-at", po::value<uint64_t>(), "token time ms, default now");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << '\n';
    return 1;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "generate-key") {
    auto key = warden::crypto::ed25519_key::generate();
    if (!key || !key->write_pem(get_string(vm, "key"))) {
      warden::common::critical("cannot write Ed25519 private key");
    }
    std::cout << "identity=" << to_string(key->signer()) << '\n';
    return 0;
  }

  if (command == "identity") {
    std::cout << "identity=" << to_string(load_key(vm).signer()) << '\n';
    return 0;
  }

  if (command == "vote") {
    auto action = vm.contains("action")
                      ? get_enum<quorum_action_t>(vm, "action")
                      : quorum_action_t::sign_artifact;
    print_vote(vm, action, get_hash32(vm, "digest"));
    return 0;
  }

  if (command == "ceremony") {
    auto role = get_enum<key_role_t>(vm, "role");
    auto parent = vm.contains("parent")
                      ? std::optional<hash32_t>{get_hash32(vm, "parent")}
                      : std::nullopt;
    auto app_id = vm.contains("app-id")
                      ? std::optional<std::string>{get_string(vm, "app-id")}
                      : std::nullopt;
    auto subject = warden::keys::manager::ceremony_subject(role, parent, app_id);
    print_vote(vm, quorum_action_t::create_key, subject);
    return 0;
  }

  if (command == "source") {
    auto key = load_key(vm);
    auto source = source_ref_t{};
    source.locator = get_string(vm, "locator");
    source.commit = get_string(vm, "commit");
    source.tag = vm["tag"].as<std::string>();
    std::cout << "signer=" << to_string(key.signer()) << '\n'
              << "signature="
              << to_hex(key.sign(warden::build::source_message(source)))
              << '\n';
    return 0;
  }

  if (command == "token") {
    auto key = load_key(vm);
    auto token = authority_token_t{};
    token.action = get_enum<suspension_action_t>(vm, "token-action");
    if (vm.contains("artifact")) {
      token.subject_kind = suspension_subject_t::artifact;
      token.subject = get_hash32(vm, "artifact");
    } else {
      token.subject_kind = suspension_subject_t::application;
      token.label = get_string(vm, "app-id");
      token.subject = warden::suspension::application_subject(token.label);
    }
    token.reason = get_string(vm, "reason");
    token.issued_at = timestamp_or_now(vm, "issued-at");
    token.nonce = random_nonce();
    token.authority = key.signer();
    auto signature = key.sign(warden::suspension::token_message(token));
    std::cout << "action=" << to_string(token.action) << '\n'
              << "subject_kind=" << to_string(token.subject_kind) << '\n'
              << "subject=" << to_hex(token.subject) << '\n'
              << "label=" << token.label << '\n'
              << "issued_at=" << token.issued_at << '\n'
              << "nonce=" << to_hex(token.nonce) << '\n'
              << "authority=" << to_string(token.authority) << '\n'
              << "signature=" << to_hex(signature) << '\n';
    return 0;
  }

  warden::common::critical(
      "command must be generate-key|identity|vote|ceremony|source|token");
}
