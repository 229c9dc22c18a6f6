#include <gtest/gtest.h>
#include <warden/build/egress_relay.hpp>
#include <warden/testing/net.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;

constexpr auto kEstablished =
    "HTTP/1.1 200 Connection established\r\n\r\n";

struct relay_harness final {
  explicit relay_harness(const uint16_t upstream_port,
                         std::vector<std::string> allowlist) {
    auto listener = warden::testing::listen_loopback(port);
    relay.emplace(std::move(listener),
                  warden::build::egress_endpoint_t{
                      .host = "127.0.0.1",
                      .port = std::to_string(upstream_port)},
                  std::move(allowlist));
  }

  uint16_t port{0};
  std::optional<warden::build::egress_relay> relay;
};

}  // namespace

TEST(egress_relay, parses_proxy_endpoint) {
  auto parsed = warden::build::parse_egress_proxy("http://proxy.internal:3128/");
  ASSERT_TRUE(parsed.ok()) << parsed.log;
  EXPECT_EQ(parsed.value->host, "proxy.internal");
  EXPECT_EQ(parsed.value->port, "3128");

  parsed = warden::build::parse_egress_proxy("[fd00::1]:8080");
  ASSERT_TRUE(parsed.ok()) << parsed.log;
  EXPECT_EQ(parsed.value->host, "fd00::1");
  EXPECT_EQ(parsed.value->port, "8080");

  EXPECT_FALSE(warden::build::parse_egress_proxy("proxy.internal").ok());
  EXPECT_FALSE(warden::build::parse_egress_proxy("proxy.internal:").ok());
  EXPECT_FALSE(warden::build::parse_egress_proxy(":3128").ok());
  EXPECT_FALSE(warden::build::parse_egress_proxy("proxy:http").ok());
}

TEST(egress_relay, extracts_request_target_host) {
  using warden::build::request_target_host;
  EXPECT_EQ(request_target_host("CONNECT Mirror.Example.org:443 HTTP/1.1"),
            "mirror.example.org");
  EXPECT_EQ(request_target_host(
                "GET http://repo.example.org:8080/maven/a.pom HTTP/1.1"),
            "repo.example.org");
  EXPECT_EQ(request_target_host("GET https://user@repo.example.org/x HTTP/1.1"),
            "repo.example.org");
  EXPECT_EQ(request_target_host("CONNECT [2001:db8::1]:443 HTTP/1.1"),
            "2001:db8::1");
  EXPECT_FALSE(request_target_host("GET /relative/path HTTP/1.1").has_value());
  EXPECT_FALSE(request_target_host("CONNECT :443 HTTP/1.1").has_value());
  EXPECT_FALSE(request_target_host("garbage").has_value());
}

TEST(egress_relay, matches_allowlist_entries) {
  const auto allowlist = std::vector<std::string>{"repo.example.org",
                                                  ".mirror.example.net"};
  using warden::build::host_allowed;
  EXPECT_TRUE(host_allowed(allowlist, "repo.example.org"));
  EXPECT_TRUE(host_allowed(allowlist, "REPO.example.org"));
  EXPECT_FALSE(host_allowed(allowlist, "evil.repo.example.org"));
  EXPECT_TRUE(host_allowed(allowlist, "mirror.example.net"));
  EXPECT_TRUE(host_allowed(allowlist, "eu.mirror.example.net"));
  EXPECT_FALSE(host_allowed(allowlist, "evilmirror.example.net"));
  EXPECT_FALSE(host_allowed({}, "repo.example.org"));
}

TEST(egress_relay, forwards_allowlisted_connect_to_upstream) {
  auto upstream = warden::testing::single_reply_server{kEstablished};
  auto harness = relay_harness{upstream.port(), {"repo.example.org"}};

  auto client = warden::testing::connect_loopback(harness.port);
  ASSERT_TRUE(client);
  ASSERT_TRUE(warden::testing::send_text(
      client.get(),
      "CONNECT repo.example.org:443 HTTP/1.1\r\nHost: repo.example.org\r\n\r\n"));
  auto reply = warden::testing::read_until(client.get(), "\r\n\r\n");
  EXPECT_EQ(reply.rfind("HTTP/1.1 200", 0), 0u) << reply;

  auto received = upstream.received();
  EXPECT_EQ(received.rfind("CONNECT repo.example.org:443 HTTP/1.1\r\n", 0), 0u)
      << received;
  EXPECT_EQ(harness.relay->forwarded(), 1u);
  EXPECT_EQ(harness.relay->refused(), 0u);
}

TEST(egress_relay, refuses_hosts_outside_allowlist) {
  auto upstream = warden::testing::single_reply_server{kEstablished};
  auto harness = relay_harness{upstream.port(), {"repo.example.org"}};

  auto client = warden::testing::connect_loopback(harness.port);
  ASSERT_TRUE(client);
  ASSERT_TRUE(warden::testing::send_text(
      client.get(), "GET http://exfil.example.com/upload HTTP/1.1\r\n\r\n"));
  auto reply = warden::testing::read_until(client.get(), "\r\n\r\n");
  EXPECT_EQ(reply.rfind("HTTP/1.1 403", 0), 0u) << reply;
  EXPECT_EQ(harness.relay->refused(), 1u);
  EXPECT_EQ(harness.relay->forwarded(), 0u);

  // a request line without a host is refused too
  auto bare = warden::testing::connect_loopback(harness.port);
  ASSERT_TRUE(bare);
  ASSERT_TRUE(
      warden::testing::send_text(bare.get(), "GET /index.html HTTP/1.1\r\n\r\n"));
  reply = warden::testing::read_until(bare.get(), "\r\n\r\n");
  EXPECT_EQ(reply.rfind("HTTP/1.1 403", 0), 0u) << reply;
  EXPECT_EQ(harness.relay->refused(), 2u);
}

TEST(egress_relay, reports_unreachable_upstream) {
  auto harness = relay_harness{warden::testing::unused_loopback_port(),
                               {"repo.example.org"}};

  auto client = warden::testing::connect_loopback(harness.port);
  ASSERT_TRUE(client);
  ASSERT_TRUE(warden::testing::send_text(
      client.get(), "CONNECT repo.example.org:443 HTTP/1.1\r\n\r\n"));
  auto reply = warden::testing::read_until(client.get(), "\r\n\r\n");
  EXPECT_EQ(reply.rfind("HTTP/1.1 502", 0), 0u) << reply;
}

TEST(egress_relay, stopping_closes_open_connections) {
  auto upstream = warden::testing::single_reply_server{kEstablished};
  auto harness = relay_harness{upstream.port(), {"repo.example.org"}};

  auto client = warden::testing::connect_loopback(harness.port);
  ASSERT_TRUE(client);
  ASSERT_TRUE(warden::testing::send_text(
      client.get(), "CONNECT repo.example.org:443 HTTP/1.1\r\n\r\n"));
  auto reply = warden::testing::read_until(client.get(), "\r\n\r\n");
  ASSERT_EQ(reply.rfind("HTTP/1.1 200", 0), 0u) << reply;

  const auto started = std::chrono::steady_clock::now();
  harness.relay.reset();
  EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);

  char byte = 0;
  EXPECT_LE(recv(client.get(), &byte, 1, 0), 0);
}
