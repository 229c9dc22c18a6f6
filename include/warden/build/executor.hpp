#pragma once

#include <warden/build/sandbox.hpp>
#include <warden/schema/build_job.hpp>
#include <warden/schema/builder_result.hpp>

#include <atomic>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace warden::build {

/// Everything one attempt may see. `cancelled` flips when the job is
/// cancelled, the attempt times out, or the job deadline passes; executors
/// must stop promptly once it is set.
struct execution_context_t final {
  const sandbox_lease& lease;
  const warden::schema::build_job_t& job;
  warden::schema::duration_milliseconds_t timeout_ms{};
  const std::atomic<bool>& cancelled;
};

struct execution_outcome_t final {
  warden::schema::builder_status_t status{
      warden::schema::builder_status_t::failed};
  std::string error;
  std::string log;
  // produced artifact inside the sandbox, when status is success
  std::optional<std::filesystem::path> artifact;
};

using build_executor_t =
    std::function<execution_outcome_t(const execution_context_t& context)>;

struct process_executor_options final {
  std::filesystem::path recipes_dir;
  std::string egress_proxy;
  uint64_t max_memory_bytes{8ull * 1024 * 1024 * 1024};
  uint64_t max_file_descriptors{4096};
  std::size_t max_log_bytes{4 * 1024 * 1024};
};

/// Runs `<recipes_dir>/<recipe_id>` as a child process inside the sandbox
/// workspace. The child gets its own session and process group, rlimits and
/// a private network namespace; the attempt fails if the namespace cannot be
/// created. The whole group is killed when the attempt ends, whatever the
/// outcome. A recipe that ships a non-empty `<recipe_id>.allowlist` gets only
/// a loopback HTTP proxy inside its namespace, relayed to `egress_proxy` for
/// allowlisted hosts. The artifact is expected at `$WARDEN_OUTPUT/artifact`.
build_executor_t make_process_executor(process_executor_options options);

/// Hosts listed one per line in `<recipes_dir>/<recipe_id>.allowlist`.
std::vector<std::string> load_network_allowlist(
    const std::filesystem::path& recipes_dir,
    const std::string& recipe_id);

}  // namespace warden::build
