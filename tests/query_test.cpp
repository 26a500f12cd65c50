#include <catch2/catch.hpp>
#include <sstream>
#include <string>
#include "error.hpp"
#include "mock_dns_server.hpp"
#include "query.hpp"

using boost::asio::ip::make_address;
using boost::system::error_code;
using namespace dnsprobe;
using namespace dnsprobe::test;

namespace {

ServerSettings FastSettings() {
  ServerSettings settings;
  settings.timeout = std::chrono::milliseconds(300);
  settings.retries = 0;
  return settings;
}

Client LocalClient(uint16_t port) {
  return Client({Server::Create(make_address("127.0.0.1"), port,
                                Transport::UDP, FastSettings())});
}

RequestMessage WwwRequest() {
  return RequestMessage::Create("www.example.com", dns::ToInt(dns::TYPE::A));
}

MockDnsServer::Responder AnswerWith(std::vector<std::string> addresses) {
  return [addresses](const dns::Message& query, bool) {
    std::vector<dns::ResourceRecord> answers;
    for (auto& address : addresses) {
      answers.push_back(MakeAddressRecord("www.example.com", address));
    }
    return std::vector<dns::Message>{MakeResponse(query, std::move(answers))};
  };
}

// recursive resolver and only name server of example.com in one
MockDnsServer::Responder ExampleZone(std::vector<std::string> addresses) {
  auto www = AnswerWith(std::move(addresses));
  return [www](const dns::Message& query, bool over_tcp) {
    auto& question = query.questions.front();
    auto type = static_cast<dns::TYPE>(question.type);
    std::vector<dns::ResourceRecord> answers;
    std::vector<dns::ResourceRecord> authorities;
    if (type == dns::TYPE::SOA) {
      authorities.push_back(MakeSoaRecord("example.com", 1));
    } else if (type == dns::TYPE::NS) {
      answers.push_back(
          MakeNameRecord("example.com", dns::TYPE::NS, "ns1.example.com"));
    } else if (type == dns::TYPE::A &&
               dns::NameEquals(question.name, "ns1.example.com.")) {
      answers.push_back(MakeAddressRecord("ns1.example.com", "127.0.0.1"));
    } else if (type == dns::TYPE::A &&
               dns::NameEquals(question.name, "www.example.com.")) {
      return www(query, over_tcp);
    }
    return std::vector<dns::Message>{
        MakeResponse(query, std::move(answers), std::move(authorities))};
  };
}

struct Result {
  bool done = false;
  error_code error;
  std::optional<Answer> answer;
  std::optional<Verification> verification;
};

Result Run(Client client, std::optional<Client> recursive_client,
           uint16_t authoritative_port = kDnsPort) {
  Result result;
  VerifiedQuery::create(std::move(client), WwwRequest(),
                        std::move(recursive_client), FastSettings(),
                        authoritative_port)
      ->Start([&result](error_code error, std::optional<Answer> answer,
                        std::optional<Verification> verification) {
        result.error = error;
        result.answer = std::move(answer);
        result.verification = std::move(verification);
        result.done = true;
      });
  RunUntil(result.done);
  return result;
}

std::vector<std::string> DiffLines(const std::vector<DiffItem>& diff) {
  std::vector<std::string> lines;
  for (auto& item : diff) {
    std::ostringstream line;
    line << item;
    lines.push_back(line.str());
  }
  return lines;
}

}  // namespace

TEST_CASE("A query without verification", "[query]") {
  MockDnsServer primary(AnswerWith({"192.0.2.1"}));

  auto result = Run(LocalClient(primary.port()), std::nullopt);
  REQUIRE(result.done);
  CHECK_FALSE(result.error);
  REQUIRE(result.answer);
  CHECK_FALSE(result.verification);
}

TEST_CASE("A failed primary query has no answer", "[query]") {
  MockDnsServer recursive(ExampleZone({"192.0.2.1"}));

  auto result = Run(LocalClient(UnusedPort()), LocalClient(recursive.port()));
  REQUIRE(result.done);
  CHECK(result.error);
  CHECK_FALSE(result.answer);
  CHECK_FALSE(result.verification);
  CHECK(recursive.udp_queries() == 0);
}

TEST_CASE("A failed verification keeps the primary answer", "[query]") {
  MockDnsServer primary(AnswerWith({"192.0.2.1"}));

  SECTION("no SOA record") {
    MockDnsServer recursive([](const dns::Message& query, bool) {
      return std::vector<dns::Message>{MakeResponse(query, {})};
    });
    auto result = Run(LocalClient(primary.port()),
                      LocalClient(recursive.port()));
    REQUIRE(result.done);
    CHECK_FALSE(result.error);
    REQUIRE(result.answer);
    CHECK(result.answer->stats().server_port() == primary.port());
    REQUIRE(result.verification);
    CHECK(result.verification->error == Error::no_soa_record);
    CHECK(IsVerificationError(result.verification->error));
    CHECK_FALSE(result.verification->authoritative_answer);
    CHECK_FALSE(result.verification->diff);
  }

  SECTION("the recursive resolver does not answer") {
    MockDnsServer silent(
        [](const dns::Message&, bool) { return std::vector<dns::Message>(); });
    auto result =
        Run(LocalClient(primary.port()), LocalClient(silent.port()));
    REQUIRE(result.done);
    CHECK_FALSE(result.error);
    REQUIRE(result.answer);
    REQUIRE(result.verification);
    CHECK(result.verification->error == boost::asio::error::timed_out);
  }

  SECTION("the authoritative server does not answer") {
    MockDnsServer recursive(ExampleZone({"192.0.2.1"}));
    auto result = Run(LocalClient(primary.port()),
                      LocalClient(recursive.port()), UnusedPort());
    REQUIRE(result.done);
    CHECK_FALSE(result.error);
    REQUIRE(result.answer);
    REQUIRE(result.verification);
    CHECK(result.verification->error);
    REQUIRE(result.verification->authoritative_servers.size() == 1);
  }
}

TEST_CASE("The answer is compared with the authoritative one", "[query]") {
  SECTION("same records") {
    MockDnsServer primary(AnswerWith({"192.0.2.2", "192.0.2.1"}));
    MockDnsServer zone(ExampleZone({"192.0.2.1", "192.0.2.2"}));
    auto result = Run(LocalClient(primary.port()), LocalClient(zone.port()),
                      zone.port());
    REQUIRE(result.done);
    CHECK_FALSE(result.error);
    REQUIRE(result.answer);
    REQUIRE(result.verification);
    CHECK_FALSE(result.verification->error);
    REQUIRE(result.verification->authoritative_servers.size() == 1);
    CHECK(result.verification->authoritative_servers[0].address ==
          make_address("127.0.0.1"));
    CHECK(result.verification->authoritative_answer);
    CHECK_FALSE(result.verification->diff);
  }

  SECTION("different records") {
    MockDnsServer primary(AnswerWith({"192.0.2.1", "192.0.2.3"}));
    MockDnsServer zone(ExampleZone({"192.0.2.1", "192.0.2.2"}));
    auto result = Run(LocalClient(primary.port()), LocalClient(zone.port()),
                      zone.port());
    REQUIRE(result.done);
    CHECK_FALSE(result.error);
    REQUIRE(result.answer);
    REQUIRE(result.verification);
    CHECK_FALSE(result.verification->error);
    REQUIRE(result.verification->diff);
    CHECK(DiffLines(*result.verification->diff) ==
          std::vector<std::string>{
              "  www.example.com. IN A 192.0.2.1",
              "- www.example.com. IN A 192.0.2.2",
              "+ www.example.com. IN A 192.0.2.3",
          });
  }
}
