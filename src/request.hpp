#ifndef DNSPROBE_REQUEST_H_
#define DNSPROBE_REQUEST_H_
#include <optional>
#include <string>
#include <vector>
#include "dns.hpp"

namespace dnsprobe {

struct RequestFlags {
  bool recursion_desired = true;
  bool checking_disabled = false;
  bool authentic_data = false;
  bool dnssec_ok = false;
};

// A query that can be encoded again for every attempt, each attempt with its
// own ID and the payload size of the server it goes to.
class RequestMessage {
 public:
  enum class Framing {
    DATAGRAM,
    // rfc1035 4.2.2 length prefixed
    STREAM,
  };

  static RequestMessage Create(const std::string& qname, uint16_t qtype,
                               const RequestFlags& flags = RequestFlags());
  // AXFR, or IXFR (rfc1995) carrying the client's SOA serial
  static RequestMessage CreateXfr(const std::string& zone,
                                  std::optional<uint32_t> ixfr_serial);

  static uint16_t RandomId();

  dns::MessageEncoder::ResultType Encode(uint16_t id, uint16_t udp_payload_size,
                                         Framing framing,
                                         std::vector<uint8_t>& buffer) const;

  // header and questions of response decoded, checks QR, ID and the echoed
  // question. Follow up messages of a zone transfer may omit the question.
  bool Accepts(const dns::Message& response, uint16_t id,
               bool allow_empty_question = false) const;
  bool Accepts(const uint8_t* data, size_t size, uint16_t id,
               bool allow_empty_question = false) const;

  // more than one response message is expected
  bool is_streaming() const;
  const dns::Question& question() const { return question_; }
  const RequestFlags& flags() const { return flags_; }
  const std::optional<uint32_t>& ixfr_serial() const { return ixfr_serial_; }

 private:
  RequestMessage() = default;

  dns::Question question_;
  RequestFlags flags_;
  std::optional<uint32_t> ixfr_serial_;
};

}  // namespace dnsprobe
#endif  // DNSPROBE_REQUEST_H_
