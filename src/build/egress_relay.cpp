#include <warden/build/egress_relay.hpp>

#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <iterator>
#include <string_view>

#include <unistd.h>

using namespace warden::schema;

namespace warden::build {

namespace {

constexpr auto kPollIntervalMs = 100;
constexpr auto kConnectTimeoutSeconds = 5;
constexpr auto kMaxRequestLine = std::size_t{8192};
constexpr auto kBufferSize = std::size_t{16384};

constexpr auto kForbidden = std::string_view{
    "HTTP/1.1 403 Forbidden\r\nContent-Length: 0\r\nConnection: close\r\n\r\n"};
constexpr auto kBadGateway = std::string_view{
    "HTTP/1.1 502 Bad Gateway\r\nContent-Length: 0\r\nConnection: "
    "close\r\n\r\n"};

std::string lower(const std::string_view text) {
  auto out = std::string{text};
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

bool send_all(const int fd, const char* data, std::size_t size) {
  while (size > 0) {
    auto sent = send(fd, data, size, MSG_NOSIGNAL);
    if (sent < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    data += sent;
    size -= static_cast<std::size_t>(sent);
  }
  return true;
}

bool send_all(const int fd, const std::string_view data) {
  return send_all(fd, data.data(), data.size());
}

// False once the relay is stopping.
bool wait_readable(const int fd, const std::atomic<bool>& stopping) {
  auto ready = pollfd{fd, POLLIN, 0};
  while (!stopping.load()) {
    if (poll(&ready, 1, kPollIntervalMs) > 0) {
      return true;
    }
  }
  return false;
}

warden::common::scoped_fd connect_upstream(const egress_endpoint_t& upstream) {
  auto hints = addrinfo{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* found = nullptr;
  if (getaddrinfo(upstream.host.c_str(), upstream.port.c_str(), &hints,
                  &found) != 0) {
    return {};
  }
  auto out = warden::common::scoped_fd{};
  for (auto* address = found; address != nullptr && !out;
       address = address->ai_next) {
    auto fd = warden::common::scoped_fd{
        socket(address->ai_family, address->ai_socktype | SOCK_CLOEXEC,
               address->ai_protocol)};
    if (!fd) {
      continue;
    }
    // SO_SNDTIMEO bounds connect(); cleared again for the relayed stream
    auto timeout = timeval{kConnectTimeoutSeconds, 0};
    setsockopt(fd.get(), SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));
    if (connect(fd.get(), address->ai_addr, address->ai_addrlen) == 0) {
      timeout = timeval{0, 0};
      setsockopt(fd.get(), SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));
      out = std::move(fd);
    }
  }
  freeaddrinfo(found);
  return out;
}

// Copies bytes both ways until each side has closed its half.
void pump(const int client, const int upstream,
          const std::atomic<bool>& stopping) {
  pollfd fds[2] = {{client, POLLIN, 0}, {upstream, POLLIN, 0}};
  const int peers[2] = {upstream, client};
  char buffer[kBufferSize];
  while (!stopping.load() && (fds[0].fd >= 0 || fds[1].fd >= 0)) {
    if (poll(fds, 2, kPollIntervalMs) <= 0) {
      continue;
    }
    for (auto i = 0; i < 2; ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0) {
        continue;
      }
      auto count = recv(fds[i].fd, buffer, sizeof(buffer), 0);
      if (count < 0 && errno == EINTR) {
        continue;
      }
      if (count <= 0 ||
          !send_all(peers[i], buffer, static_cast<std::size_t>(count))) {
        shutdown(peers[i], SHUT_WR);
        fds[i].fd = -1;
      }
    }
  }
}

}  // namespace

outcome<egress_endpoint_t> parse_egress_proxy(std::string_view proxy) {
  constexpr auto kScheme = std::string_view{"http://"};
  if (proxy.starts_with(kScheme)) {
    proxy.remove_prefix(kScheme.size());
  }
  while (!proxy.empty() && proxy.back() == '/') {
    proxy.remove_suffix(1);
  }
  auto colon = proxy.rfind(':');
  if (colon == std::string_view::npos || colon == 0 ||
      colon + 1 == proxy.size()) {
    return make_error<egress_endpoint_t>(error_code_t::invalid_request,
                                         "egress proxy must be host:port");
  }
  auto host = proxy.substr(0, colon);
  auto port = proxy.substr(colon + 1);
  if (!std::all_of(port.begin(), port.end(),
                   [](unsigned char c) { return std::isdigit(c); })) {
    return make_error<egress_endpoint_t>(error_code_t::invalid_request,
                                         "egress proxy port is not numeric");
  }
  if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
    host = host.substr(1, host.size() - 2);
  }
  return make_ok(
      egress_endpoint_t{.host = std::string{host}, .port = std::string{port}});
}

std::optional<std::string> request_target_host(
    const std::string_view request_line) {
  auto method_end = request_line.find(' ');
  if (method_end == std::string_view::npos) {
    return std::nullopt;
  }
  auto method = request_line.substr(0, method_end);
  auto target = request_line.substr(method_end + 1);
  target = target.substr(0, target.find(' '));

  auto authority = target;
  if (method != "CONNECT") {
    auto scheme = target.find("://");
    if (scheme == std::string_view::npos) {
      return std::nullopt;
    }
    authority = target.substr(scheme + 3);
    authority = authority.substr(0, authority.find_first_of("/?#"));
  }
  if (auto at = authority.rfind('@'); at != std::string_view::npos) {
    authority = authority.substr(at + 1);
  }

  auto host = std::string_view{};
  if (!authority.empty() && authority.front() == '[') {
    auto close = authority.find(']');
    if (close == std::string_view::npos) {
      return std::nullopt;
    }
    host = authority.substr(1, close - 1);
  } else {
    host = authority.substr(0, authority.find(':'));
  }
  if (host.empty()) {
    return std::nullopt;
  }
  return lower(host);
}

bool host_allowed(const std::vector<std::string>& allowlist,
                  const std::string_view host) {
  const auto candidate = lower(host);
  return std::any_of(
      allowlist.begin(), allowlist.end(), [&](const std::string& entry) {
        const auto pattern = lower(entry);
        if (pattern.size() > 1 && pattern.front() == '.') {
          return candidate == pattern.substr(1) ||
                 (candidate.size() > pattern.size() &&
                  candidate.ends_with(pattern));
        }
        return candidate == pattern;
      });
}

struct egress_relay::session final {
  // guarded by egress_relay::mutex_
  int client{-1};
  int upstream{-1};
  std::atomic<bool> done{false};
  std::thread thread;
};

egress_relay::egress_relay(warden::common::scoped_fd listener,
                           egress_endpoint_t upstream,
                           std::vector<std::string> allowlist)
    : listener_{std::move(listener)},
      upstream_{std::move(upstream)},
      allowlist_{std::move(allowlist)} {
  acceptor_ = std::thread{[this] { accept_loop(); }};
}

egress_relay::~egress_relay() {
  stopping_ = true;
  if (acceptor_.joinable()) {
    acceptor_.join();
  }
  auto remaining = std::vector<std::unique_ptr<session>>{};
  {
    auto lock = std::scoped_lock{mutex_};
    for (auto& connection : sessions_) {
      if (connection->client >= 0) {
        shutdown(connection->client, SHUT_RDWR);
      }
      if (connection->upstream >= 0) {
        shutdown(connection->upstream, SHUT_RDWR);
      }
    }
    remaining.swap(sessions_);
  }
  for (auto& connection : remaining) {
    connection->thread.join();
  }
  spdlog::debug("Egress relay closed: {} forwarded, {} refused",
                forwarded_.load(), refused_.load());
}

void egress_relay::accept_loop() {
  while (!stopping_.load()) {
    auto ready = pollfd{listener_.get(), POLLIN, 0};
    auto polled = poll(&ready, 1, kPollIntervalMs);
    reap_finished();
    if (polled <= 0) {
      continue;
    }
    if ((ready.revents & (POLLERR | POLLNVAL)) != 0) {
      spdlog::error("Egress relay listener failed");
      return;
    }
    auto client = accept4(listener_.get(), nullptr, nullptr, SOCK_CLOEXEC);
    if (client < 0) {
      continue;
    }
    auto lock = std::scoped_lock{mutex_};
    auto& connection = *sessions_.emplace_back(std::make_unique<session>());
    connection.client = client;
    connection.thread = std::thread{[this, &connection] { serve(connection); }};
  }
}

void egress_relay::serve(session& connection) {
  const auto client = connection.client;
  auto head = std::string{};
  auto line_end = std::string::npos;
  char buffer[kBufferSize];
  while ((line_end = head.find("\r\n")) == std::string::npos &&
         head.size() <= kMaxRequestLine && wait_readable(client, stopping_)) {
    auto count = recv(client, buffer, sizeof(buffer), 0);
    if (count < 0 && errno == EINTR) {
      continue;
    }
    if (count <= 0) {
      break;
    }
    head.append(buffer, static_cast<std::size_t>(count));
  }

  if (line_end != std::string::npos) {
    auto host =
        request_target_host(std::string_view{head}.substr(0, line_end));
    if (host && host_allowed(allowlist_, *host)) {
      auto upstream = connect_upstream(upstream_);
      if (!upstream) {
        spdlog::warn("Egress proxy {}:{} unreachable", upstream_.host,
                     upstream_.port);
        send_all(client, kBadGateway);
      } else {
        const auto upstream_fd = upstream.get();
        {
          auto lock = std::scoped_lock{mutex_};
          connection.upstream = upstream.release();
        }
        if (!stopping_.load() && send_all(upstream_fd, head)) {
          ++forwarded_;
          pump(client, upstream_fd, stopping_);
        }
      }
    } else {
      ++refused_;
      spdlog::warn("Egress to '{}' refused: not in allowlist",
                   host.value_or(std::string{"?"}));
      send_all(client, kForbidden);
    }
  }

  {
    auto lock = std::scoped_lock{mutex_};
    close(connection.client);
    connection.client = -1;
    if (connection.upstream >= 0) {
      close(connection.upstream);
      connection.upstream = -1;
    }
  }
  connection.done = true;
}

void egress_relay::reap_finished() {
  auto finished = std::vector<std::unique_ptr<session>>{};
  {
    auto lock = std::scoped_lock{mutex_};
    auto split = std::partition(
        sessions_.begin(), sessions_.end(),
        [](const auto& connection) { return !connection->done.load(); });
    std::move(split, sessions_.end(), std::back_inserter(finished));
    sessions_.erase(split, sessions_.end());
  }
  for (auto& connection : finished) {
    connection->thread.join();
  }
}

}  // namespace warden::build
