#ifndef DNSPROBE_DNS_MESSAGE_ENCODER_H_
#define DNSPROBE_DNS_MESSAGE_ENCODER_H_

#include <unordered_map>
#include <vector>

#include "dns_definition.hpp"

namespace dnsprobe {
namespace dns {

class MessageEncoderContext;

class MessageEncoder {
 public:
  enum class ResultType { good, bad };
  // Appends message to buffer starting at offset, bytes before offset are
  // kept and are not part of the message (room for a tcp length prefix).
  static ResultType Encode(const Message& message, std::vector<uint8_t>& buffer,
                           size_t offset);
  // Encodes message with the rfc1035 4.2.2 2 bytes length prefix.
  static ResultType EncodeTcpMessage(const Message& message,
                                     std::vector<uint8_t>& buffer);
};

}  // namespace dns
}  // namespace dnsprobe
#endif  // DNSPROBE_DNS_MESSAGE_ENCODER_H_
