#include <catch2/catch.hpp>
#include <sstream>
#include "error.hpp"
#include "mock_dns_server.hpp"
#include "output.hpp"

using boost::asio::ip::make_address;
using Catch::Contains;
using namespace dnsprobe;
using namespace dnsprobe::test;

namespace {

std::vector<uint8_t> ExampleMessage(std::vector<std::string> addresses) {
  dns::Message query;
  query.header.id = 4242;
  query.header.is_recursion_desired = true;
  query.questions.push_back({"example.com.", dns::ToInt(dns::TYPE::A)});
  std::vector<dns::ResourceRecord> answers;
  for (auto& address : addresses) {
    answers.push_back(MakeAddressRecord("example.com", address, 60));
  }
  return Encode(
      MakeResponse(query, std::move(answers),
                   {MakeNameRecord("example.com", dns::TYPE::NS,
                                   "ns1.example.com")}));
}

Answer ExampleAnswer(std::vector<std::string> addresses) {
  Stats stats(make_address("192.0.2.53"), 53, Protocol::UDP);
  stats.Finalize();
  return Answer(ExampleMessage(std::move(addresses)), stats);
}

}  // namespace

TEST_CASE("Answers are printed like dig", "[output]") {
  std::ostringstream os;
  PrintAnswer(os, ExampleAnswer({"192.0.2.1"}));
  auto text = os.str();
  CHECK_THAT(text, Contains(";; ->>HEADER<<- opcode: QUERY, rcode: NOERROR, "
                            "id: 4242\n"));
  CHECK_THAT(text, Contains(";; flags: qr rd ra; QUERY: 1, ANSWER: 1, "
                            "AUTHORITY: 1, ADDITIONAL: 0\n"));
  CHECK_THAT(text, Contains(";; QUESTION SECTION:\n;example.com.  IN  A\n"));
  CHECK_THAT(text, Contains(";; ANSWER SECTION:\n"
                            "example.com.  60  IN  A  192.0.2.1\n"));
  CHECK_THAT(text, Contains(";; AUTHORITY SECTION:\n"
                            "example.com.  300  IN  NS  ns1.example.com.\n"));
  CHECK_THAT(text, !Contains("ADDITIONAL SECTION"));
  CHECK_THAT(text, !Contains("OPT PSEUDOSECTION"));
  CHECK_THAT(text, Contains(";; SERVER: 192.0.2.53#53 (UDP)\n"));
  CHECK_THAT(text, Contains(";; MSG SIZE  rcvd: " +
                            std::to_string(ExampleMessage({"192.0.2.1"})
                                               .size())));
}

TEST_CASE("A message that does not parse is reported", "[output]") {
  std::ostringstream os;
  Stats stats(make_address("192.0.2.53"), 53, Protocol::TCP);
  PrintAnswer(os, Answer({0x12, 0x34, 0x81}, stats));
  CHECK(os.str() == ";; malformed message of 3 bytes\n");
}

TEST_CASE("Verification results", "[output]") {
  std::ostringstream os;
  Verification verification;

  SECTION("failure") {
    verification.error = Error::no_ns_records;
    PrintVerification(os, verification);
    CHECK(os.str() == "\n;; Verification failed: " +
                          make_error_code(Error::no_ns_records).message() +
                          "\n");
  }

  SECTION("matching answers") {
    verification.authoritative_answer = ExampleAnswer({"192.0.2.1"});
    PrintVerification(os, verification);
    CHECK(os.str() == "\n;; Authoritative ANSWER matches.\n");
  }

  SECTION("different answers") {
    verification.authoritative_answer =
        ExampleAnswer({"192.0.2.1", "192.0.2.2"});
    verification.diff = DiffAnswers(ExampleMessage({"192.0.2.1", "192.0.2.2"}),
                                    ExampleMessage({"192.0.2.1", "192.0.2.3"}));
    REQUIRE(verification.diff);
    PrintVerification(os, verification);
    CHECK(os.str() ==
          "\n;; Authoritative ANSWER does not match.\n"
          ";; Difference of ANSWER with authoritative server 192.0.2.53#53:\n"
          "  example.com. IN A 192.0.2.1\n"
          "- example.com. IN A 192.0.2.2\n"
          "+ example.com. IN A 192.0.2.3\n");
  }
}
