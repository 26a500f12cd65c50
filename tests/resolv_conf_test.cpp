#include <catch2/catch.hpp>
#include <sstream>
#include "resolv_conf.hpp"

using boost::asio::ip::make_address;
using namespace dnsprobe;

TEST_CASE("resolv.conf parsing", "[resolv_conf]") {
  std::istringstream input(
      "# generated\n"
      "search example.com\n"
      "nameserver 192.0.2.53\n"
      "nameserver fe80::1%eth0   ; link local\n"
      "nameserver not-an-address\n"
      "options timeout:3 attempts:9 rotate\n");
  auto conf = ResolvConf::Parse(input);
  REQUIRE(conf.nameservers.size() == 2);
  CHECK(conf.nameservers[0] == make_address("192.0.2.53"));
  CHECK(conf.nameservers[1] == make_address("fe80::1"));
  CHECK(conf.options.timeout == std::chrono::seconds(3));
  // capped like the system resolver does
  CHECK(conf.options.attempts == 5);
  CHECK_FALSE(conf.options.use_vc);

  auto servers = conf.ToServers();
  REQUIRE(servers.size() == 2);
  CHECK(servers[0].port == kDnsPort);
  CHECK(servers[0].transport == Transport::UDP_TCP);
  CHECK(servers[0].retries == 5);
  CHECK(servers[0].timeout == std::chrono::seconds(3));
}

TEST_CASE("resolv.conf defaults", "[resolv_conf]") {
  SECTION("missing file") {
    auto conf = ResolvConf::Load("/nonexistent/resolv.conf");
    CHECK(conf.nameservers.empty());
    auto servers = conf.ToServers();
    REQUIRE(servers.size() == 1);
    CHECK(servers[0].address == make_address("127.0.0.1"));
    CHECK(servers[0].retries == 2);
    CHECK(servers[0].timeout == std::chrono::seconds(5));
    CHECK(servers[0].udp_payload_size == 1232);
  }

  SECTION("use-vc") {
    std::istringstream input("nameserver 192.0.2.53\noptions use-vc\n");
    auto servers = ResolvConf::Parse(input).ToServers();
    REQUIRE(servers.size() == 1);
    CHECK(servers[0].transport == Transport::TCP);
  }
}

TEST_CASE("resolv.conf timeout of zero", "[resolv_conf]") {
  std::istringstream input("nameserver 192.0.2.53\noptions timeout:0\n");
  auto conf = ResolvConf::Parse(input);
  CHECK(conf.options.timeout == std::chrono::seconds(1));
  auto servers = conf.ToServers();
  REQUIRE(servers.size() == 1);
  CHECK(servers[0].timeout == std::chrono::seconds(1));
}
