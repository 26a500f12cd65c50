#include "xfr_tracker.hpp"

#include "logging.hpp"

namespace dnsprobe {

bool XfrTracker::IsSerialNewer(uint32_t a, uint32_t b) {
  return a != b && static_cast<uint32_t>(a - b) < 0x80000000u;
}

XfrTracker::ResultType XfrTracker::Feed(const dns::Message& message) {
  if (stage_ == Stage::COMPLETE) {
    return ResultType::good;
  }
  if (message.header.response_code != dns::ToInt(dns::RCODE::SUCCESS)) {
    LOG_DEBUG("transfer refused: "
              << dns::RcodeToString(message.header.response_code));
    return ResultType::bad;
  }
  if (stage_ == Stage::FIRST_SOA && message.answers.empty()) {
    return ResultType::bad;
  }

  for (auto& record : message.answers) {
    auto is_soa = record.type == dns::ToInt(dns::TYPE::SOA);
    dns::rdata::Soa soa;
    if (is_soa && !dns::rdata::ToSoa(record.rdata, soa)) {
      return ResultType::bad;
    }
    switch (stage_) {
      case Stage::FIRST_SOA:
        if (!is_soa) {
          LOG_DEBUG("transfer starts with " << dns::TypeToString(record.type));
          return ResultType::bad;
        }
        target_serial_ = soa.serial;
        stage_ = is_ixfr_ ? Stage::SECOND_RECORD : Stage::AXFR_RECORDS;
        break;
      case Stage::SECOND_RECORD:
        if (is_soa && soa.serial == target_serial_) {
          stage_ = Stage::COMPLETE;
        } else if (is_soa) {
          stage_ = Stage::IXFR_DELETIONS;
        } else {
          stage_ = Stage::AXFR_RECORDS;
        }
        break;
      case Stage::AXFR_RECORDS:
        if (is_soa && soa.serial == target_serial_) {
          stage_ = Stage::COMPLETE;
        }
        break;
      case Stage::IXFR_DELETIONS:
        if (is_soa) {
          stage_ = Stage::IXFR_ADDITIONS;
        }
        break;
      case Stage::IXFR_ADDITIONS:
        if (is_soa) {
          stage_ = soa.serial == target_serial_ ? Stage::COMPLETE
                                                : Stage::IXFR_DELETIONS;
        }
        break;
      case Stage::COMPLETE:
        break;
    }
    if (stage_ == Stage::COMPLETE) {
      break;
    }
  }

  if (stage_ == Stage::SECOND_RECORD &&
      !IsSerialNewer(target_serial_, requested_serial_)) {
    // only the server's SOA, the client is up to date
    stage_ = Stage::COMPLETE;
  }
  return stage_ == Stage::COMPLETE ? ResultType::good
                                   : ResultType::indeterminate;
}

}  // namespace dnsprobe
