#include <catch2/catch.hpp>
#include "mock_dns_server.hpp"
#include "xfr_tracker.hpp"

using namespace dnsprobe;
using namespace dnsprobe::test;

namespace {

dns::Message Transfer(std::vector<dns::ResourceRecord> answers) {
  dns::Message query;
  query.questions.push_back({"example.com.", dns::ToInt(dns::TYPE::Q_AXFR)});
  return MakeResponse(query, std::move(answers));
}

dns::ResourceRecord Host(const std::string& name) {
  return MakeAddressRecord(name + ".example.com", "192.0.2.1");
}

}  // namespace

TEST_CASE("AXFR ends with the first SOA repeated", "[xfr]") {
  XfrTracker tracker;
  SECTION("in one message") {
    CHECK(tracker.Feed(Transfer({MakeSoaRecord("example.com", 5), Host("a"),
                                 MakeSoaRecord("example.com", 5)})) ==
          XfrTracker::ResultType::good);
    CHECK(tracker.is_complete());
  }

  SECTION("across messages") {
    CHECK(tracker.Feed(Transfer({MakeSoaRecord("example.com", 5),
                                 Host("a")})) ==
          XfrTracker::ResultType::indeterminate);
    CHECK(tracker.Feed(Transfer({Host("b"), Host("c")})) ==
          XfrTracker::ResultType::indeterminate);
    CHECK_FALSE(tracker.is_complete());
    CHECK(tracker.Feed(Transfer({MakeSoaRecord("example.com", 5)})) ==
          XfrTracker::ResultType::good);
  }

  SECTION("a transfer that does not start with a SOA") {
    CHECK(tracker.Feed(Transfer({Host("a")})) == XfrTracker::ResultType::bad);
  }

  SECTION("an empty first message") {
    CHECK(tracker.Feed(Transfer({})) == XfrTracker::ResultType::bad);
  }

  SECTION("a refused transfer") {
    auto refused = Transfer({});
    refused.header.response_code = dns::ToInt(dns::RCODE::REFUSED);
    CHECK(tracker.Feed(refused) == XfrTracker::ResultType::bad);
  }
}

TEST_CASE("IXFR completion", "[xfr]") {
  XfrTracker tracker(3);

  SECTION("the client is up to date") {
    CHECK(tracker.Feed(Transfer({MakeSoaRecord("example.com", 3)})) ==
          XfrTracker::ResultType::good);
  }

  SECTION("incremental changes") {
    CHECK(tracker.Feed(Transfer({MakeSoaRecord("example.com", 5),
                                 MakeSoaRecord("example.com", 3), Host("a"),
                                 MakeSoaRecord("example.com", 4), Host("b")})) ==
          XfrTracker::ResultType::indeterminate);
    CHECK(tracker.Feed(Transfer({MakeSoaRecord("example.com", 4), Host("b"),
                                 MakeSoaRecord("example.com", 5), Host("c")})) ==
          XfrTracker::ResultType::indeterminate);
    CHECK(tracker.Feed(Transfer({MakeSoaRecord("example.com", 5)})) ==
          XfrTracker::ResultType::good);
  }

  SECTION("a full zone instead of changes") {
    CHECK(tracker.Feed(Transfer({MakeSoaRecord("example.com", 5), Host("a"),
                                 Host("b")})) ==
          XfrTracker::ResultType::indeterminate);
    CHECK(tracker.Feed(Transfer({MakeSoaRecord("example.com", 5)})) ==
          XfrTracker::ResultType::good);
  }
}

TEST_CASE("IXFR opening SOA alone in the first message", "[xfr]") {
  SECTION("a newer zone keeps reading") {
    XfrTracker tracker(1);
    CHECK(tracker.Feed(Transfer({MakeSoaRecord("example.com", 5)})) ==
          XfrTracker::ResultType::indeterminate);
    CHECK_FALSE(tracker.is_complete());
    CHECK(tracker.Feed(Transfer({MakeSoaRecord("example.com", 1), Host("a"),
                                 MakeSoaRecord("example.com", 5),
                                 Host("b")})) ==
          XfrTracker::ResultType::indeterminate);
    CHECK(tracker.Feed(Transfer({MakeSoaRecord("example.com", 5)})) ==
          XfrTracker::ResultType::good);
  }

  SECTION("an older zone is up to date") {
    XfrTracker tracker(7);
    CHECK(tracker.Feed(Transfer({MakeSoaRecord("example.com", 5)})) ==
          XfrTracker::ResultType::good);
  }

  SECTION("a serial that wrapped around is newer") {
    XfrTracker tracker(0xfffffff0u);
    CHECK(tracker.Feed(Transfer({MakeSoaRecord("example.com", 3)})) ==
          XfrTracker::ResultType::indeterminate);
  }
}

TEST_CASE("serial number comparison", "[xfr]") {
  CHECK(XfrTracker::IsSerialNewer(5, 1));
  CHECK_FALSE(XfrTracker::IsSerialNewer(1, 5));
  CHECK_FALSE(XfrTracker::IsSerialNewer(5, 5));
  CHECK(XfrTracker::IsSerialNewer(2, 0xffffffffu));
  CHECK_FALSE(XfrTracker::IsSerialNewer(0xffffffffu, 2));
}
