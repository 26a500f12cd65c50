#ifndef DNSPROBE_DNS_MESSAGE_DECODER_H_
#define DNSPROBE_DNS_MESSAGE_DECODER_H_

#include <boost/endian/conversion.hpp>
#include <string>
#include <vector>
#include "dns_definition.hpp"

namespace dnsprobe {
namespace dns {

class MessageDecoder {
 public:
  enum class ResultType { good, bad, indeterminate };

  // every section must decode
  static ResultType DecodeCompleteMessage(Message& message,
                                         const uint8_t* buffer,
                                         size_t buffer_size);
  // header and questions must decode, a record whose framing is broken ends
  // the decoding and a record with malformed RDATA is skipped
  static ResultType DecodeMessageLeniently(Message& message,
                                           const uint8_t* buffer,
                                           size_t buffer_size);
  static ResultType DecodeHeaderAndQuestions(Message& message,
                                             const uint8_t* buffer,
                                             size_t buffer_size);
  // rfc1035 4.2.2, the 2 bytes length prefix followed by a message
  static ResultType ReadMessageSizeFromTcpMessage(const uint8_t* buffer,
                                                  size_t buffer_size,
                                                  uint16_t& size);

  static ResultType DecodeName(std::string& name, const uint8_t* buffer,
                               size_t buffer_size, size_t from_offset,
                               size_t& end_offset);

 private:
  enum class Mode { COMPLETE, LENIENT, HEADER_AND_QUESTIONS };

  static ResultType Decode(Message& message, const uint8_t* buffer,
                           size_t buffer_size, Mode mode);
  static ResultType DecodeQuestion(Question& question, const uint8_t* buffer,
                                   size_t buffer_size, size_t from_offset,
                                   size_t& end_offset);
  static ResultType DecodeResourceRecord(ResourceRecord& record,
                                         const uint8_t* buffer,
                                         size_t buffer_size, size_t from_offset,
                                         size_t& end_offset);
  static ResultType ExpandRdata(ResourceRecord& record, const uint8_t* buffer,
                                size_t buffer_size, size_t rdata_offset);
};

}  // namespace dns
}  // namespace dnsprobe
#endif  // DNSPROBE_DNS_MESSAGE_DECODER_H_
