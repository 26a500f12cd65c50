#include <catch2/catch.hpp>
#include <chrono>
#include <functional>
#include "client.hpp"
#include "error.hpp"
#include "mock_dns_server.hpp"

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

Server LocalServer(uint16_t port, Transport transport,
                   std::optional<std::string> tls_hostname = std::nullopt) {
  return Server::Create(make_address("127.0.0.1"), port, transport,
                        FastSettings(), tls_hostname);
}

RequestMessage ExampleRequest() {
  return RequestMessage::Create("example.com", dns::ToInt(dns::TYPE::A));
}

std::vector<dns::Message> AnswerExample(const dns::Message& query, bool) {
  return {MakeResponse(query,
                       {MakeAddressRecord("example.com.", "93.184.216.34")})};
}

struct Result {
  bool done = false;
  error_code error;
  std::optional<Answer> answer;
};

Result Request(const std::vector<Server>& servers,
               const RequestMessage& request = ExampleRequest()) {
  Result result;
  Client client(servers);
  client.AsyncRequest(request,
                      [&result](error_code error, std::optional<Answer> answer) {
                        result.error = error;
                        result.answer = std::move(answer);
                        result.done = true;
                      });
  RunUntil(result.done);
  return result;
}

}  // namespace

TEST_CASE("Configuration errors are reported before any I/O",
          "[client][configuration]") {
  MockDnsServer server(AnswerExample);

  SECTION("empty server list") {
    auto result = Request({});
    REQUIRE(result.done);
    CHECK(result.error == Error::no_servers);
    CHECK(IsConfigurationError(result.error));
    CHECK_FALSE(result.answer);
  }

  SECTION("TLS without a host name") {
    auto result = Request({LocalServer(server.port(), Transport::TLS)});
    REQUIRE(result.done);
    CHECK(result.error == Error::missing_tls_hostname);
    CHECK(server.tcp_queries() == 0);
  }

  SECTION("an unusable TLS host name is not failed over") {
    auto result =
        Request({LocalServer(server.port(), Transport::TLS,
                             std::string("dns\0.example", 12)),
                 LocalServer(server.port(), Transport::UDP)});
    REQUIRE(result.done);
    CHECK(result.error == Error::invalid_tls_hostname);
    CHECK(IsConfigurationError(result.error));
    CHECK(server.udp_queries() == 0);
    CHECK(server.tcp_queries() == 0);

    auto too_long = Request({LocalServer(server.port(), Transport::TLS,
                                         std::string(256, 'a'))});
    CHECK(too_long.error == Error::invalid_tls_hostname);
  }

  SECTION("a name that can not be encoded") {
    auto result = Request({LocalServer(server.port(), Transport::UDP),
                           LocalServer(server.port(), Transport::TCP)},
                          RequestMessage::Create("www..example.com",
                                                 dns::ToInt(dns::TYPE::A)));
    REQUIRE(result.done);
    CHECK(result.error == Error::invalid_request);
    CHECK_FALSE(result.answer);
    CHECK(server.udp_queries() == 0);
    CHECK(server.tcp_queries() == 0);
  }

  SECTION("multi response over UDP or UDP then TCP") {
    for (auto transport : {Transport::UDP, Transport::UDP_TCP}) {
      bool done = false;
      error_code result_error;
      Client client({LocalServer(server.port(), Transport::TCP),
                     LocalServer(server.port(), transport)});
      client.AsyncRequestMulti(
          RequestMessage::CreateXfr("example.com", std::nullopt),
          [&](error_code error, ResponseStream::pointer stream) {
            result_error = error;
            CHECK_FALSE(stream);
            done = true;
          });
      RunUntil(done);
      REQUIRE(done);
      CHECK(result_error == Error::multi_over_datagram);
    }
    CHECK(server.udp_queries() == 0);
    CHECK(server.tcp_queries() == 0);
  }
}

TEST_CASE("Servers are tried in order until one answers", "[client][failover]") {
  MockDnsServer server(AnswerExample);
  auto dead_port = UnusedPort();

  SECTION("UDP") {
    auto result = Request({LocalServer(dead_port, Transport::UDP),
                           LocalServer(server.port(), Transport::UDP)});
    REQUIRE(result.done);
    REQUIRE_FALSE(result.error);
    REQUIRE(result.answer);
    CHECK(result.answer->stats().server_port() == server.port());
    CHECK(result.answer->stats().protocol() == Protocol::UDP);
    CHECK(result.answer->stats().finalized());
    CHECK(server.udp_queries() == 1);
  }

  SECTION("TCP") {
    auto result = Request({LocalServer(dead_port, Transport::TCP),
                           LocalServer(dead_port, Transport::TCP),
                           LocalServer(server.port(), Transport::TCP)});
    REQUIRE(result.done);
    REQUIRE_FALSE(result.error);
    REQUIRE(result.answer);
    CHECK(result.answer->stats().protocol() == Protocol::TCP);
    CHECK(server.tcp_queries() == 1);
  }

  SECTION("the first answering server wins") {
    auto result = Request({LocalServer(server.port(), Transport::UDP),
                           LocalServer(dead_port, Transport::UDP)});
    REQUIRE(result.answer);
    CHECK(result.answer->stats().server_port() == server.port());
    CHECK(server.udp_queries() == 1);
  }
}

TEST_CASE("The error of the last server is reported", "[client][failover]") {
  MockDnsServer silent(
      [](const dns::Message&, bool) { return std::vector<dns::Message>(); });
  auto dead_port = UnusedPort();

  SECTION("refused after timed out") {
    auto result = Request({LocalServer(silent.port(), Transport::UDP),
                           LocalServer(dead_port, Transport::TCP)});
    REQUIRE(result.done);
    CHECK(result.error == boost::asio::error::connection_refused);
    CHECK_FALSE(result.answer);
  }

  SECTION("timed out after refused") {
    auto result = Request({LocalServer(dead_port, Transport::TCP),
                           LocalServer(silent.port(), Transport::UDP)});
    REQUIRE(result.done);
    CHECK(result.error == boost::asio::error::timed_out);
  }
}

TEST_CASE("A truncated UDP answer is retried over TCP once",
          "[client][truncation]") {
  SECTION("the TCP answer replaces the UDP one") {
    MockDnsServer server([](const dns::Message& query, bool over_tcp) {
      auto response = MakeResponse(
          query, {MakeAddressRecord("example.com.", "93.184.216.34")});
      if (!over_tcp) {
        response.answers.clear();
        response.header.is_truncated = true;
      }
      return std::vector<dns::Message>{response};
    });
    auto result = Request({LocalServer(server.port(), Transport::UDP_TCP)});
    REQUIRE_FALSE(result.error);
    REQUIRE(result.answer);
    CHECK_FALSE(result.answer->is_truncated());
    CHECK(result.answer->stats().protocol() == Protocol::TCP);
    dns::Message message;
    REQUIRE(result.answer->Decode(message) ==
            dns::MessageDecoder::ResultType::good);
    CHECK(message.answers.size() == 1);
    CHECK(server.udp_queries() == 1);
    CHECK(server.tcp_queries() == 1);
  }

  SECTION("no second escalation when TCP is truncated too") {
    MockDnsServer server([](const dns::Message& query, bool) {
      auto response = MakeResponse(query, {});
      response.header.is_truncated = true;
      return std::vector<dns::Message>{response};
    });
    auto result = Request({LocalServer(server.port(), Transport::UDP_TCP)});
    REQUIRE_FALSE(result.error);
    REQUIRE(result.answer);
    CHECK(result.answer->stats().protocol() == Protocol::TCP);
    CHECK(server.udp_queries() == 1);
    CHECK(server.tcp_queries() == 1);
  }

  SECTION("the TCP failure is what is reported") {
    MockDnsServer server([](const dns::Message& query, bool over_tcp) {
      if (over_tcp) {
        return std::vector<dns::Message>();
      }
      auto response = MakeResponse(query, {});
      response.header.is_truncated = true;
      return std::vector<dns::Message>{response};
    });
    auto result = Request({LocalServer(server.port(), Transport::UDP_TCP)});
    CHECK(result.error == boost::asio::error::timed_out);
    CHECK_FALSE(result.answer);
    CHECK(server.tcp_queries() == 1);
  }

  SECTION("plain UDP keeps the truncated answer") {
    MockDnsServer server([](const dns::Message& query, bool) {
      auto response = MakeResponse(query, {});
      response.header.is_truncated = true;
      return std::vector<dns::Message>{response};
    });
    auto result = Request({LocalServer(server.port(), Transport::UDP)});
    REQUIRE(result.answer);
    CHECK(result.answer->is_truncated());
    CHECK(server.tcp_queries() == 0);
  }
}

TEST_CASE("Datagrams that do not match the query are ignored", "[client]") {
  MockDnsServer server([](const dns::Message& query, bool) {
    auto wrong_id = MakeResponse(query, {});
    wrong_id.header.id = query.header.id + 1;
    auto wrong_question = MakeResponse(query, {});
    wrong_question.questions.front().name = "example.net.";
    return std::vector<dns::Message>{
        wrong_id, wrong_question,
        MakeResponse(query,
                     {MakeAddressRecord("example.com.", "93.184.216.34")})};
  });
  auto result = Request({LocalServer(server.port(), Transport::UDP)});
  REQUIRE_FALSE(result.error);
  REQUIRE(result.answer);
  dns::Message message;
  REQUIRE(result.answer->Decode(message) ==
          dns::MessageDecoder::ResultType::good);
  CHECK(message.answers.size() == 1);
}

TEST_CASE("A zone transfer is pulled message by message", "[client][xfr]") {
  MockDnsServer server([](const dns::Message& query, bool) {
    auto first = MakeResponse(
        query, {MakeSoaRecord("example.com", 7),
                MakeAddressRecord("a.example.com", "192.0.2.1")});
    auto second = MakeResponse(
        query, {MakeAddressRecord("b.example.com", "192.0.2.2")});
    second.questions.clear();
    auto last = MakeResponse(query, {MakeSoaRecord("example.com", 7)});
    last.questions.clear();
    return std::vector<dns::Message>{first, second, last};
  });
  auto dead_port = UnusedPort();

  bool done = false;
  error_code result_error;
  std::vector<Answer> answers;
  ResponseStream::pointer held;
  std::function<void(ResponseStream::pointer)> pull =
      [&](ResponseStream::pointer stream) {
        stream->AsyncNext(
            [&, stream](error_code error, std::optional<Answer> answer) {
              if (error || !answer) {
                result_error = error;
                done = true;
                return;
              }
              answers.push_back(std::move(*answer));
              pull(stream);
            });
      };
  Client client({LocalServer(dead_port, Transport::TCP),
                 LocalServer(server.port(), Transport::TCP)});
  client.AsyncRequestMulti(
      RequestMessage::CreateXfr("example.com", std::nullopt),
      [&](error_code error, ResponseStream::pointer stream) {
        REQUIRE_FALSE(error);
        held = stream;
        pull(stream);
      });
  RunUntil(done);
  REQUIRE(done);
  CHECK_FALSE(result_error);
  REQUIRE(answers.size() == 3);
  CHECK(held->is_complete());
  for (auto& answer : answers) {
    CHECK(answer.stats().protocol() == Protocol::TCP);
    CHECK(answer.stats().finalized());
  }
}
