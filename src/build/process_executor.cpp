#include <warden/build/egress_relay.hpp>
#include <warden/build/executor.hpp>
#include <warden/common/scoped_fd.hpp>

#include <arpa/inet.h>
#include <fcntl.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sched.h>
#include <signal.h>
#include <sys/ioctl.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <optional>
#include <thread>
#include <utility>

using namespace warden::schema;

namespace warden::build {

namespace {

using warden::common::scoped_fd;

// Port the recipe's loopback proxy listens on inside its own namespace.
constexpr auto kRecipeProxyPort = uint16_t{3128};

// Failure codes written by the child to the close-on-exec status pipe.
enum class child_failure : uint8_t {
  network_isolation = 1,
  chdir = 2,
  exec = 3,
  egress_forwarding = 4,
};

std::string_view describe(const child_failure failure) {
  switch (failure) {
    case child_failure::network_isolation:
      return "network isolation unavailable";
    case child_failure::chdir:
      return "cannot enter sandbox workspace";
    case child_failure::exec:
      return "recipe could not be executed";
    case child_failure::egress_forwarding:
      return "cannot forward egress proxy into sandbox";
  }
  return "unknown child failure";
}

/// A forked child leading its own process group. The leader stays unreaped
/// until terminate() so the group id cannot be reused while it is signalled.
class process_group final {
 public:
  explicit process_group(const pid_t leader) : leader_{leader} {}
  ~process_group() { terminate(); }

  process_group(const process_group&) = delete;
  process_group& operator=(const process_group&) = delete;

  bool exited() const {
    auto info = siginfo_t{};
    return waitid(P_PID, static_cast<id_t>(leader_), &info,
                  WEXITED | WNOHANG | WNOWAIT) == 0 &&
           info.si_pid == leader_;
  }

  /// Kills every member still running and reaps the leader. Returns the
  /// leader's wait status.
  int terminate() {
    if (!reaped_) {
      kill(-leader_, SIGKILL);
      kill(leader_, SIGKILL);
      while (waitpid(leader_, &status_, 0) < 0 && errno == EINTR) {
      }
      reaped_ = true;
    }
    return status_;
  }

 private:
  pid_t leader_;
  int status_{0};
  bool reaped_{false};
};

// Runs in the forked child: only async-signal-safe calls from here on.
int open_proxy_listener() {
  auto control = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
  if (control < 0) {
    return -1;
  }
  auto request = ifreq{};
  std::strncpy(request.ifr_name, "lo", IFNAMSIZ - 1);
  auto up = ioctl(control, SIOCGIFFLAGS, &request) == 0;
  if (up) {
    request.ifr_flags = static_cast<short>(request.ifr_flags | IFF_UP);
    up = ioctl(control, SIOCSIFFLAGS, &request) == 0;
  }
  close(control);
  if (!up) {
    return -1;
  }

  auto listener = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (listener < 0) {
    return -1;
  }
  auto address = sockaddr_in{};
  address.sin_family = AF_INET;
  address.sin_port = htons(kRecipeProxyPort);
  address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  if (bind(listener, reinterpret_cast<const sockaddr*>(&address),
           sizeof(address)) != 0 ||
      listen(listener, SOMAXCONN) != 0) {
    close(listener);
    return -1;
  }
  return listener;
}

bool send_fd(const int channel, const int fd) {
  auto byte = char{0};
  auto io = iovec{&byte, 1};
  alignas(cmsghdr) char control[CMSG_SPACE(sizeof(int))] = {};
  auto message = msghdr{};
  message.msg_iov = &io;
  message.msg_iovlen = 1;
  message.msg_control = control;
  message.msg_controllen = sizeof(control);
  auto* header = CMSG_FIRSTHDR(&message);
  header->cmsg_level = SOL_SOCKET;
  header->cmsg_type = SCM_RIGHTS;
  header->cmsg_len = CMSG_LEN(sizeof(int));
  std::memcpy(CMSG_DATA(header), &fd, sizeof(fd));
  return sendmsg(channel, &message, MSG_NOSIGNAL) == 1;
}

scoped_fd receive_fd(const int channel) {
  auto byte = char{0};
  auto io = iovec{&byte, 1};
  alignas(cmsghdr) char control[CMSG_SPACE(sizeof(int))] = {};
  auto message = msghdr{};
  message.msg_iov = &io;
  message.msg_iovlen = 1;
  message.msg_control = control;
  message.msg_controllen = sizeof(control);
  auto received = ssize_t{0};
  do {
    received = recvmsg(channel, &message, MSG_CMSG_CLOEXEC);
  } while (received < 0 && errno == EINTR);
  if (received <= 0) {
    return {};
  }
  for (auto* header = CMSG_FIRSTHDR(&message); header != nullptr;
       header = CMSG_NXTHDR(&message, header)) {
    if (header->cmsg_level == SOL_SOCKET && header->cmsg_type == SCM_RIGHTS) {
      auto fd = -1;
      std::memcpy(&fd, CMSG_DATA(header), sizeof(fd));
      return scoped_fd{fd};
    }
  }
  return {};
}

[[noreturn]] void fail_child(const int status_fd, const child_failure failure) {
  auto code = static_cast<uint8_t>(failure);
  [[maybe_unused]] auto written = write(status_fd, &code, sizeof(code));
  _exit(127);
}

void set_limit(const int resource, const uint64_t value) {
  if (value == 0) {
    return;
  }
  auto limit = rlimit{};
  limit.rlim_cur = value;
  limit.rlim_max = value;
  setrlimit(resource, &limit);
}

std::string parameter_env_name(const std::string& name) {
  auto out = std::string{"WARDEN_PARAM_"};
  for (auto c : name) {
    out.push_back(std::isalnum(static_cast<unsigned char>(c))
                      ? static_cast<char>(
                            std::toupper(static_cast<unsigned char>(c)))
                      : '_');
  }
  return out;
}

std::vector<std::string> make_environment(
    const execution_context_t& context,
    const std::vector<std::string>& allowlist) {
  const auto& job = context.job;
  auto env = std::vector<std::string>{
      "PATH=/usr/local/bin:/usr/bin:/bin",
      "HOME=" + context.lease.workspace().string(),
      "LC_ALL=C",
      "TZ=UTC",
      "SOURCE_DATE_EPOCH=0",
      "WARDEN_SOURCE_LOCATOR=" + job.source.locator,
      "WARDEN_SOURCE_COMMIT=" + job.source.commit,
      "WARDEN_SOURCE_TAG=" + job.source.tag,
      "WARDEN_OUTPUT=" + context.lease.output().string(),
      "WARDEN_BUILDER=" + context.lease.builder_id(),
  };
  for (const auto& parameter : job.parameters) {
    env.push_back(parameter_env_name(parameter.name) + "=" + parameter.value);
  }
  if (!allowlist.empty()) {
    auto joined = std::string{};
    for (const auto& host : allowlist) {
      if (!joined.empty()) {
        joined.push_back(',');
      }
      joined += host;
    }
    const auto proxy =
        "http://127.0.0.1:" + std::to_string(kRecipeProxyPort);
    env.push_back("WARDEN_NETWORK_ALLOWLIST=" + joined);
    env.push_back("http_proxy=" + proxy);
    env.push_back("https_proxy=" + proxy);
  }
  return env;
}

void append_limited(std::string& log,
                    const char* data,
                    const ssize_t count,
                    const std::size_t limit,
                    bool& truncated) {
  if (count <= 0) {
    return;
  }
  auto available = log.size() < limit ? limit - log.size() : 0;
  auto take = std::min<std::size_t>(static_cast<std::size_t>(count), available);
  log.append(data, take);
  if (take < static_cast<std::size_t>(count)) {
    truncated = true;
  }
}

void drain(const int fd,
           std::string& log,
           const std::size_t limit,
           bool& truncated) {
  char buffer[4096];
  while (true) {
    auto count = read(fd, buffer, sizeof(buffer));
    if (count <= 0) {
      return;
    }
    append_limited(log, buffer, count, limit, truncated);
  }
}

execution_outcome_t run_recipe(const process_executor_options& options,
                               const execution_context_t& context) {
  auto result = execution_outcome_t{};
  const auto recipe = options.recipes_dir / context.job.recipe_id;
  if (!std::filesystem::is_regular_file(recipe)) {
    result.error = "recipe not found: " + recipe.string();
    return result;
  }

  auto allowlist =
      load_network_allowlist(options.recipes_dir, context.job.recipe_id);
  auto upstream = std::optional<egress_endpoint_t>{};
  if (!allowlist.empty()) {
    if (options.egress_proxy.empty()) {
      result.error = "recipe requires network allowlist but no egress proxy";
      return result;
    }
    auto parsed = parse_egress_proxy(options.egress_proxy);
    if (!parsed.ok()) {
      result.error = parsed.log;
      return result;
    }
    upstream = std::move(parsed.value);
  }

  auto env_storage = make_environment(context, allowlist);
  auto envp = std::vector<char*>{};
  for (auto& entry : env_storage) {
    envp.push_back(entry.data());
  }
  envp.push_back(nullptr);
  auto command = recipe.string();
  auto argv = std::vector<char*>{command.data(), nullptr};
  auto workspace = context.lease.workspace().string();

  int fds[2];
  if (pipe2(fds, O_CLOEXEC) != 0) {
    result.error = "spawn failed";
    return result;
  }
  auto log_read = scoped_fd{fds[0]};
  auto log_write = scoped_fd{fds[1]};
  if (pipe2(fds, O_CLOEXEC) != 0) {
    result.error = "spawn failed";
    return result;
  }
  auto status_read = scoped_fd{fds[0]};
  auto status_write = scoped_fd{fds[1]};
  auto handoff_parent = scoped_fd{};
  auto handoff_child = scoped_fd{};
  if (upstream) {
    if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0) {
      result.error = "spawn failed";
      return result;
    }
    handoff_parent.reset(fds[0]);
    handoff_child.reset(fds[1]);
  }

  // outlives the process group so the recipe never loses its proxy early
  auto relay = std::optional<egress_relay>{};

  auto pid = fork();
  if (pid < 0) {
    result.error = "spawn failed";
    return result;
  }

  if (pid == 0) {
    close(status_read.get());
    close(log_read.get());
    if (unshare(CLONE_NEWNET) != 0) {
      fail_child(status_write.get(), child_failure::network_isolation);
    }
    if (handoff_child) {
      close(handoff_parent.get());
      auto listener = open_proxy_listener();
      if (listener < 0 || !send_fd(handoff_child.get(), listener)) {
        fail_child(status_write.get(), child_failure::egress_forwarding);
      }
      close(listener);
      close(handoff_child.get());
    }
    setsid();
    dup2(log_write.get(), STDOUT_FILENO);
    dup2(log_write.get(), STDERR_FILENO);
    if (chdir(workspace.c_str()) != 0) {
      fail_child(status_write.get(), child_failure::chdir);
    }
    set_limit(RLIMIT_AS, options.max_memory_bytes);
    set_limit(RLIMIT_NOFILE, options.max_file_descriptors);
    set_limit(RLIMIT_CORE, 0);
    execve(command.c_str(), argv.data(), envp.data());
    fail_child(status_write.get(), child_failure::exec);
  }

  auto group = process_group{pid};
  log_write.reset();
  status_write.reset();
  fcntl(log_read.get(), F_SETFL, O_NONBLOCK);

  auto forwarding_failed = false;
  if (upstream) {
    handoff_child.reset();
    auto listener = receive_fd(handoff_parent.get());
    handoff_parent.reset();
    if (listener) {
      relay.emplace(std::move(listener), *upstream, allowlist);
    } else {
      forwarding_failed = true;
    }
  }

  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(context.timeout_ms);
  auto truncated = false;
  auto timed_out = false;
  auto cancelled = false;
  char buffer[4096];
  while (!forwarding_failed) {
    auto count = read(log_read.get(), buffer, sizeof(buffer));
    append_limited(result.log, buffer, count, options.max_log_bytes, truncated);
    if (group.exited()) {
      break;
    }
    timed_out = std::chrono::steady_clock::now() >= deadline;
    cancelled = context.cancelled.load();
    if (timed_out || cancelled) {
      break;
    }
    if (count <= 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
  }
  // also reaches anything the recipe left running in the background
  auto status = group.terminate();
  drain(log_read.get(), result.log, options.max_log_bytes, truncated);
  if (truncated) {
    result.log += "\n(log truncated)";
  }

  auto failure = uint8_t{};
  if (read(status_read.get(), &failure, sizeof(failure)) ==
      static_cast<ssize_t>(sizeof(failure))) {
    result.error = std::string{describe(static_cast<child_failure>(failure))};
    return result;
  }
  if (forwarding_failed) {
    result.error = std::string{describe(child_failure::egress_forwarding)};
    return result;
  }

  if (timed_out) {
    result.status = builder_status_t::timed_out;
    result.error = "attempt exceeded wall-clock limit";
    return result;
  }
  if (cancelled) {
    result.error = "attempt cancelled";
    return result;
  }
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    result.error = WIFSIGNALED(status)
                       ? "recipe killed by signal " +
                             std::to_string(WTERMSIG(status))
                       : "recipe exited with status " +
                             std::to_string(WEXITSTATUS(status));
    return result;
  }

  auto artifact = context.lease.output() / "artifact";
  if (!std::filesystem::is_regular_file(artifact)) {
    result.error = "recipe produced no artifact";
    return result;
  }
  result.status = builder_status_t::success;
  result.artifact = artifact;
  return result;
}

}  // namespace

std::vector<std::string> load_network_allowlist(
    const std::filesystem::path& recipes_dir,
    const std::string& recipe_id) {
  auto hosts = std::vector<std::string>{};
  auto input = std::ifstream{recipes_dir / (recipe_id + ".allowlist")};
  auto line = std::string{};
  while (std::getline(input, line)) {
    line.erase(std::remove_if(line.begin(), line.end(),
                              [](unsigned char c) { return std::isspace(c); }),
               line.end());
    if (!line.empty() && line.front() != '#') {
      hosts.push_back(line);
    }
  }
  return hosts;
}

build_executor_t make_process_executor(process_executor_options options) {
  return [options = std::move(options)](const execution_context_t& context) {
    auto result = run_recipe(options, context);
    if (result.status != builder_status_t::success) {
      spdlog::warn("Builder '{}' attempt in sandbox {} ended {}: {}",
                   context.lease.builder_id(), to_hex(context.lease.id()),
                   to_string(result.status), result.error);
    }
    return result;
  };
}

}  // namespace warden::build
