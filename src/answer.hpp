#ifndef DNSPROBE_ANSWER_H_
#define DNSPROBE_ANSWER_H_
#include <vector>
#include "dns.hpp"
#include "stats.hpp"

namespace dnsprobe {

// A received message and the stats of the attempt that produced it.
class Answer {
 public:
  Answer(std::vector<uint8_t> raw_message, Stats stats)
      : raw_message_(std::move(raw_message)), stats_(std::move(stats)) {}

  const std::vector<uint8_t>& raw_message() const { return raw_message_; }
  const Stats& stats() const { return stats_; }

  // records with malformed data are left out
  dns::MessageDecoder::ResultType Decode(dns::Message& message) const {
    return dns::MessageDecoder::DecodeMessageLeniently(
        message, raw_message_.data(), raw_message_.size());
  }

  bool is_truncated() const {
    dns::Message message;
    return dns::MessageDecoder::DecodeHeaderAndQuestions(
               message, raw_message_.data(), raw_message_.size()) ==
               dns::MessageDecoder::ResultType::good &&
           message.header.is_truncated;
  }

 private:
  std::vector<uint8_t> raw_message_;
  Stats stats_;
};

}  // namespace dnsprobe
#endif  // DNSPROBE_ANSWER_H_
