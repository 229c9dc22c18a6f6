#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <warden/common/critical.hpp>
#include <warden/config/config.hpp>
#include <warden/execution/engine.hpp>
#include <warden/keys/vote_file.hpp>
#include <warden/rpc/server.hpp>

#include <atomic>
#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace warden::schema;

namespace {

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

void setup_logging(const warden::config::daemon_config& config) {
  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      config.log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "warden", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(config.log_level));
}

std::optional<quorum_proof_t> load_proof(
    const std::vector<std::string>& files,
    const quorum_action_t action,
    const hash32_t& subject) {
  auto proof = quorum_proof_t{};
  proof.action = action;
  proof.subject = subject;
  for (const auto& file : files) {
    auto vote = warden::keys::load_vote(file);
    if (!vote.ok()) {
      spdlog::error("{}: {}", file, vote.log);
      return std::nullopt;
    }
    proof.approvals.push_back(*vote.value);
  }
  if (proof.approvals.empty()) {
    spdlog::error("at least one --vote is required");
    return std::nullopt;
  }
  proof.request_id = proof.approvals.front().request_id;
  return proof;
}

int run_ceremony(const warden::config::daemon_config& config,
                 warden::execution::engine& engine) {
  auto& keys = engine.keys();
  const auto& ceremony = config.ceremony;

  if (config.command == "list-keys") {
    for (const auto& record : keys.list()) {
      std::cout << to_hex(record.key_id) << ' ' << to_string(record.role)
                << ' ' << record.app_id.value_or("-") << ' '
                << (record.status == key_status_t::active ? "active"
                                                          : "revoked")
                << ' ' << to_string(signer_id_t{record.public_key}) << '\n';
    }
    return 0;
  }

  if (config.command == "create-key") {
    auto role = try_from_string<key_role_t>(ceremony.role);
    if (!role) {
      spdlog::error("--role must be root, repository_signing or app_signing");
      return 1;
    }
    auto parent = std::optional<hash32_t>{};
    if (!ceremony.parent.empty()) {
      parent = try_make_hash32(ceremony.parent);
      if (!parent) {
        spdlog::error("--parent must be a 32 byte hex key id");
        return 1;
      }
    }
    auto app_id = ceremony.app_id.empty()
                      ? std::nullopt
                      : std::optional<std::string>{ceremony.app_id};
    auto proof = load_proof(
        ceremony.votes, quorum_action_t::create_key,
        warden::keys::manager::ceremony_subject(*role, parent, app_id));
    if (!proof) {
      return 1;
    }
    auto created = keys.create_key(*role, parent, app_id, *proof);
    if (!created.ok()) {
      spdlog::error("Key ceremony failed: {} ({})", to_string(created.code),
                    created.log);
      return 1;
    }
    std::cout << "key_id=" << to_hex(created.value->key_id) << '\n'
              << "public_key="
              << to_string(signer_id_t{created.value->public_key}) << '\n';
    return 0;
  }

  auto key_id = try_make_hash32(ceremony.key_id);
  if (!key_id) {
    spdlog::error("--key-id must be a 32 byte hex key id");
    return 1;
  }
  auto proof = load_proof(ceremony.votes, quorum_action_t::revoke_key, *key_id);
  if (!proof) {
    return 1;
  }
  auto revoked = keys.revoke(*key_id, *proof);
  if (!revoked.ok()) {
    spdlog::error("Revocation failed: {} ({})", to_string(revoked.code),
                  revoked.log);
    return 1;
  }
  std::cout << "revoked_at=" << *revoked.value->revoked_at << '\n';
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto parsed = warden::config::parse(argc, argv);
  if (!parsed.ok()) {
    std::cerr << parsed.log << '\n';
    return 1;
  }
  auto config = std::move(*parsed.value);
  if (config.show_help) {
    std::cout << warden::config::make_options_description() << std::endl;
    return 0;
  }

  setup_logging(config);

  auto encoder = warden::schema::encoding::scale_encoder_t{};
  auto storage =
      warden::storage::make_storage<warden::storage::rocksdb_storage_tag>(
          config.db_path);
  auto engine = warden::execution::engine{
      encoder, storage,
      warden::build::make_process_executor(config.executor),
      std::move(config.engine), warden::schema::system_time_source()};

  auto report = engine.verify_audit();
  if (!report.intact) {
    warden::common::critical("audit chain broken at sequence " +
                             std::to_string(report.first_broken_sequence.value_or(0)) +
                             ": " + report.reason);
  }
  spdlog::info("Audit chain intact ({} entries)", report.entries_checked);

  if (config.command != "serve") {
    auto code = run_ceremony(config, engine);
    spdlog::shutdown();
    return code;
  }

  spdlog::info("gRPC service listening on {}", config.grpc_address);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = warden::rpc::listener{engine};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(config.grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    warden::common::critical("failed to start gRPC server on " +
                             config.grpc_address);
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(
          engine.hsm().connected());
      engine.sweep();
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::shutdown();
  return 0;
}
