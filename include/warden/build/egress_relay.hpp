#pragma once

#include <warden/common/scoped_fd.hpp>
#include <warden/schema/outcome.hpp>

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace warden::build {

struct egress_endpoint_t final {
  std::string host;
  std::string port;
};

/// Accepts `host:port` with an optional `http://` prefix and trailing slash.
warden::schema::outcome<egress_endpoint_t> parse_egress_proxy(
    std::string_view proxy);

/// Host named by an HTTP proxy request line, either the authority of a
/// CONNECT or the host of an absolute-form URI. The port is dropped.
std::optional<std::string> request_target_host(std::string_view request_line);

/// Exact, case-insensitive match. An entry starting with '.' also admits any
/// subdomain of the rest of the entry.
bool host_allowed(const std::vector<std::string>& allowlist,
                  std::string_view host);

/// Serves a listening socket opened inside a recipe's network namespace.
/// Each connection's first request line is checked against the allowlist;
/// allowed connections are forwarded to the egress proxy, every other one is
/// answered with 403 and closed. Stops and closes every connection when
/// destroyed.
class egress_relay final {
 public:
  egress_relay(warden::common::scoped_fd listener,
               egress_endpoint_t upstream,
               std::vector<std::string> allowlist);
  ~egress_relay();

  egress_relay(const egress_relay&) = delete;
  egress_relay& operator=(const egress_relay&) = delete;

  std::size_t forwarded() const { return forwarded_.load(); }
  std::size_t refused() const { return refused_.load(); }

 private:
  struct session;

  void accept_loop();
  void serve(session& connection);
  void reap_finished();

  warden::common::scoped_fd listener_;
  egress_endpoint_t upstream_;
  std::vector<std::string> allowlist_;
  std::atomic<bool> stopping_{false};
  std::atomic<std::size_t> forwarded_{0};
  std::atomic<std::size_t> refused_{0};
  mutable std::mutex mutex_;
  std::vector<std::unique_ptr<session>> sessions_;
  std::thread acceptor_;
};

}  // namespace warden::build
