#include <catch2/catch.hpp>
#include <sstream>
#include "diff.hpp"
#include "mock_dns_server.hpp"

using namespace dnsprobe;
using namespace dnsprobe::test;

namespace {

std::vector<uint8_t> AnswerWith(std::vector<dns::ResourceRecord> answers) {
  dns::Message query;
  query.header.id = 7;
  query.questions.push_back({"example.com.", dns::ToInt(dns::TYPE::A)});
  return Encode(MakeResponse(query, std::move(answers)));
}

std::string ToString(const DiffItem& item) {
  std::ostringstream os;
  os << item;
  return os.str();
}

}  // namespace

TEST_CASE("Identical answers have no difference", "[diff]") {
  auto message = AnswerWith({MakeAddressRecord("example.com", "192.0.2.1"),
                             MakeAddressRecord("example.com", "192.0.2.2")});
  CHECK_FALSE(DiffAnswers(message, message));
}

TEST_CASE("TTLs are not compared", "[diff]") {
  auto left = AnswerWith({MakeAddressRecord("example.com", "192.0.2.1", 300),
                          MakeAddressRecord("example.com", "192.0.2.2", 300)});
  auto right = AnswerWith({MakeAddressRecord("example.com", "192.0.2.2", 20),
                           MakeAddressRecord("example.com", "192.0.2.1", 86400)});
  CHECK_FALSE(DiffAnswers(left, right));
}

TEST_CASE("Names compare case-insensitively", "[diff]") {
  auto left = AnswerWith(
      {MakeNameRecord("www.example.com", dns::TYPE::CNAME, "Host.Example.COM")});
  auto right = AnswerWith(
      {MakeNameRecord("WWW.example.com", dns::TYPE::CNAME, "host.example.com")});
  CHECK_FALSE(DiffAnswers(left, right));
}

TEST_CASE("An additional record on the right is added", "[diff]") {
  auto left = AnswerWith({MakeAddressRecord("example.com", "93.184.216.34")});
  auto right = AnswerWith({MakeAddressRecord("example.com", "93.184.216.34"),
                           MakeAddressRecord("example.com", "93.184.216.35")});
  auto diff = DiffAnswers(left, right);
  REQUIRE(diff);
  REQUIRE(diff->size() == 2);
  CHECK((*diff)[0].action == Action::UNCHANGED);
  CHECK(ToString((*diff)[0]) == "  example.com. IN A 93.184.216.34");
  CHECK((*diff)[1].action == Action::ADDED);
  CHECK(ToString((*diff)[1]) == "+ example.com. IN A 93.184.216.35");
}

TEST_CASE("Items are sorted by record, not grouped by action", "[diff]") {
  auto left = AnswerWith({MakeAddressRecord("b.example.com", "192.0.2.2"),
                          MakeAddressRecord("d.example.com", "192.0.2.4")});
  auto right = AnswerWith({MakeAddressRecord("d.example.com", "192.0.2.4"),
                           MakeAddressRecord("a.example.com", "192.0.2.1"),
                           MakeAddressRecord("c.example.com", "192.0.2.3")});
  auto diff = DiffAnswers(left, right);
  REQUIRE(diff);
  REQUIRE(diff->size() == 4);
  CHECK(ToString((*diff)[0]) == "+ a.example.com. IN A 192.0.2.1");
  CHECK(ToString((*diff)[1]) == "- b.example.com. IN A 192.0.2.2");
  CHECK(ToString((*diff)[2]) == "+ c.example.com. IN A 192.0.2.3");
  CHECK(ToString((*diff)[3]) == "  d.example.com. IN A 192.0.2.4");
}

TEST_CASE("An unparseable message has an empty answer", "[diff]") {
  auto right = AnswerWith({MakeAddressRecord("example.com", "192.0.2.1")});
  std::vector<uint8_t> garbage{0x00, 0x01, 0x02};
  auto diff = DiffAnswers(garbage, right);
  REQUIRE(diff);
  REQUIRE(diff->size() == 1);
  CHECK((*diff)[0].action == Action::ADDED);

  CHECK_FALSE(DiffAnswers(garbage, std::vector<uint8_t>()));
}
