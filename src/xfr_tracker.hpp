#ifndef DNSPROBE_XFR_TRACKER_H_
#define DNSPROBE_XFR_TRACKER_H_
#include <optional>
#include "dns.hpp"

namespace dnsprobe {

// Follows the answer records of a zone transfer to tell when the last
// message has arrived.
//   AXFR (rfc5936): SOA, records..., SOA
//   IXFR (rfc1995): a single SOA when the client is up to date, an AXFR style
//   reply, or SOA followed by sequences of
//   [old SOA, deletions..., new SOA, additions...] and the final SOA.
class XfrTracker {
 public:
  enum class ResultType {
    // transfer complete
    good,
    bad,
    // more messages to come
    indeterminate,
  };

  explicit XfrTracker(std::optional<uint32_t> ixfr_serial = std::nullopt)
      : is_ixfr_(ixfr_serial.has_value()),
        requested_serial_(ixfr_serial.value_or(0)) {}

  ResultType Feed(const dns::Message& message);

  bool is_complete() const { return stage_ == Stage::COMPLETE; }

  // rfc1982 serial number arithmetic, true if a is newer than b
  static bool IsSerialNewer(uint32_t a, uint32_t b);

 private:
  enum class Stage {
    FIRST_SOA,
    // IXFR only, the record after the first SOA picks the reply style
    SECOND_RECORD,
    AXFR_RECORDS,
    IXFR_DELETIONS,
    IXFR_ADDITIONS,
    COMPLETE,
  } stage_ = Stage::FIRST_SOA;

  bool is_ixfr_;
  uint32_t requested_serial_;
  uint32_t target_serial_ = 0;
};

}  // namespace dnsprobe
#endif  // DNSPROBE_XFR_TRACKER_H_
