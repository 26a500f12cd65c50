#include <catch2/catch.hpp>
#include <sstream>
#include "host_lookup.hpp"
#include "mock_dns_server.hpp"
#include "output.hpp"

using boost::asio::ip::make_address;
using boost::system::error_code;
using namespace dnsprobe;
using namespace dnsprobe::test;

namespace {

std::vector<dns::Message> Hosts(const dns::Message& query, bool) {
  auto& question = query.questions.front();
  auto type = static_cast<dns::TYPE>(question.type);
  std::vector<dns::ResourceRecord> answers;
  if (dns::NameEquals(question.name, "www.example.com.")) {
    answers.push_back(MakeNameRecord("www.example.com", dns::TYPE::CNAME,
                                     "web.example.net"));
    if (type == dns::TYPE::A) {
      answers.push_back(MakeAddressRecord("web.example.net", "192.0.2.10"));
      answers.push_back(MakeAddressRecord("web.example.net", "192.0.2.11"));
      // not on the chain
      answers.push_back(MakeAddressRecord("other.example.net", "192.0.2.99"));
    } else if (type == dns::TYPE::AAAA) {
      answers.push_back(MakeAddressRecord("web.example.net", "2001:db8::10"));
    }
  } else if (type == dns::TYPE::PTR &&
             dns::NameEquals(question.name, "10.2.0.192.in-addr.arpa.")) {
    answers.push_back(MakeNameRecord("10.2.0.192.in-addr.arpa",
                                     dns::TYPE::PTR, "web.example.net"));
  }
  return {MakeResponse(query, std::move(answers))};
}

Client LocalClient(uint16_t port) {
  ServerSettings settings;
  settings.timeout = std::chrono::milliseconds(300);
  settings.retries = 0;
  return Client({Server::Create(make_address("127.0.0.1"), port,
                                Transport::UDP, settings)});
}

struct Result {
  bool done = false;
  error_code error;
  HostLookupResult lookup;
};

HostLookup::Handler Store(Result& result) {
  return [&result](error_code error, HostLookupResult lookup) {
    result.error = error;
    result.lookup = std::move(lookup);
    result.done = true;
  };
}

std::string Printed(const HostLookupResult& lookup) {
  std::ostringstream os;
  PrintHostLookup(os, lookup);
  return os.str();
}

}  // namespace

TEST_CASE("Forward lookup of a host", "[lookup]") {
  MockDnsServer server(Hosts);

  SECTION("follows the alias") {
    Result result;
    HostLookup::create(LocalClient(server.port()))
        ->AsyncLookupHost("www.example.com", Store(result));
    RunUntil(result.done);
    REQUIRE(result.done);
    REQUIRE_FALSE(result.error);
    CHECK(result.lookup.canonical_name == "web.example.net.");
    REQUIRE(result.lookup.addresses.size() == 3);
    CHECK(result.lookup.addresses[0] == make_address("192.0.2.10"));
    CHECK(result.lookup.addresses[1] == make_address("192.0.2.11"));
    CHECK(result.lookup.addresses[2] == make_address("2001:db8::10"));
    CHECK(server.udp_queries() == 2);
    CHECK(Printed(result.lookup) ==
          "www.example.com (alias for web.example.net.)\n"
          "  192.0.2.10\n"
          "  192.0.2.11\n"
          "  2001:db8::10\n");
  }

  SECTION("a name without addresses") {
    Result result;
    HostLookup::create(LocalClient(server.port()))
        ->AsyncLookupHost("nothing.example.com", Store(result));
    RunUntil(result.done);
    REQUIRE_FALSE(result.error);
    CHECK(result.lookup.addresses.empty());
    CHECK(Printed(result.lookup) ==
          "nothing.example.com\n  <no addresses found>\n");
  }
}

TEST_CASE("Reverse lookup of an address", "[lookup]") {
  MockDnsServer server(Hosts);

  Result result;
  HostLookup::create(LocalClient(server.port()))
      ->AsyncLookupAddress(make_address("192.0.2.10"), Store(result));
  RunUntil(result.done);
  REQUIRE(result.done);
  REQUIRE_FALSE(result.error);
  REQUIRE(result.lookup.host_names.size() == 1);
  CHECK(result.lookup.host_names[0] == "web.example.net.");
  CHECK(Printed(result.lookup) == "192.0.2.10\n  web.example.net.\n");

  Result unknown;
  HostLookup::create(LocalClient(server.port()))
      ->AsyncLookupAddress(make_address("192.0.2.77"), Store(unknown));
  RunUntil(unknown.done);
  REQUIRE_FALSE(unknown.error);
  CHECK(Printed(unknown.lookup) == "192.0.2.77\n  <no hosts found>\n");
}

TEST_CASE("A lookup fails when no query is answered", "[lookup]") {
  MockDnsServer silent(
      [](const dns::Message&, bool) { return std::vector<dns::Message>(); });

  Result result;
  HostLookup::create(LocalClient(silent.port()))
      ->AsyncLookupHost("www.example.com", Store(result));
  RunUntil(result.done);
  REQUIRE(result.done);
  CHECK(result.error == boost::asio::error::timed_out);
  CHECK(silent.udp_queries() == 2);
}

TEST_CASE("The canonical name follows the CNAME chain", "[lookup]") {
  dns::Message response;
  response.answers.push_back(
      MakeNameRecord("a.example", dns::TYPE::CNAME, "B.example"));
  response.answers.push_back(
      MakeNameRecord("b.example", dns::TYPE::CNAME, "c.example"));
  response.answers.push_back(MakeAddressRecord("c.example", "192.0.2.1"));
  CHECK(HostLookup::CanonicalName(response, "a.example") == "c.example.");
  CHECK(HostLookup::FindAddresses(response, "A.example.").size() == 1);

  SECTION("a loop ends") {
    response.answers.push_back(
        MakeNameRecord("c.example", dns::TYPE::CNAME, "a.example"));
    CHECK_FALSE(HostLookup::CanonicalName(response, "a.example").empty());
  }
}
