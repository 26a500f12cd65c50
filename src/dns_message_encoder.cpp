#include <algorithm>
#include <boost/endian/conversion.hpp>
#include <cstddef>
#include <limits>
#include <string>
#include <unordered_map>
#include <vector>

#include "dns.hpp"

namespace endian = boost::endian;
using std::string;
using std::unordered_map;
using std::vector;

namespace dnsprobe {
namespace dns {

class MessageEncoderContext {
 public:
  MessageEncoderContext(std::vector<uint8_t>& arg_buffer, size_t arg_offset)
      : buffer(arg_buffer), message_offset(arg_offset) {}
  std::vector<uint8_t>& buffer;
  // compression pointers are relative to the first byte of the message
  size_t message_offset;
  // lowercased name suffix -> offset in message
  std::unordered_map<std::string, size_t> encoded_labels;
};

#define WRITE_FLAG(FLAGS_, FLAG_NAME_, VALUE_)                      \
  (FLAGS_) = ((FLAGS_ & (~RawHeader::Flag::FLAG_NAME_##_mask)) |    \
              (((VALUE_) << RawHeader::Flag::FLAG_NAME_##_offset) & \
               RawHeader::Flag::FLAG_NAME_##_mask))

#define SAFE_SET_INT(TO_, FROM_)                                      \
  do {                                                                \
    if (std::numeric_limits<decltype(TO_)>::max() < (FROM_) ||        \
        std::numeric_limits<decltype(TO_)>::min() > (FROM_)) {        \
      return MessageEncoder::ResultType::bad;                         \
    }                                                                 \
    (TO_) = endian::native_to_big(static_cast<decltype(TO_)>(FROM_)); \
  } while (false)

inline bool EncodeName(MessageEncoderContext& context, const string& name);

inline MessageEncoder::ResultType EncodeResourceRecord(
    MessageEncoderContext& context, const ResourceRecord& record);

MessageEncoder::ResultType MessageEncoder::Encode(const Message& message,
                                                  std::vector<uint8_t>& buffer,
                                                  size_t offset) {
  MessageEncoderContext context(buffer, offset);
  buffer.resize(offset);
  buffer.reserve(offset + 512);

  {
    // encode header
    RawHeader destination{};
    auto& source = message.header;
    destination.ID = endian::native_to_big(source.id);
    WRITE_FLAG(destination.FLAGS, QR, source.is_response ? 1 : 0);
    WRITE_FLAG(destination.FLAGS, Opcode, source.operation_code);
    WRITE_FLAG(destination.FLAGS, AA, source.is_authoritative_answer ? 1 : 0);
    WRITE_FLAG(destination.FLAGS, TC, source.is_truncated ? 1 : 0);
    WRITE_FLAG(destination.FLAGS, RD, source.is_recursion_desired ? 1 : 0);
    WRITE_FLAG(destination.FLAGS, RA, source.is_recursion_available ? 1 : 0);
    WRITE_FLAG(destination.FLAGS, Z, source.z);
    WRITE_FLAG(destination.FLAGS, AD, source.is_authentic_data ? 1 : 0);
    WRITE_FLAG(destination.FLAGS, CD, source.is_checking_disabled ? 1 : 0);
    WRITE_FLAG(destination.FLAGS, RCODE, source.response_code);
    SAFE_SET_INT(destination.QDCOUNT, message.questions.size());
    SAFE_SET_INT(destination.ANCOUNT, message.answers.size());
    SAFE_SET_INT(destination.NSCOUNT, message.authorities.size());
    SAFE_SET_INT(destination.ARCOUNT, message.additional.size());

    auto raw = reinterpret_cast<const uint8_t*>(&destination);
    buffer.insert(buffer.end(), raw, raw + sizeof(RawHeader));
  }

  for (auto& question : message.questions) {
    if (!EncodeName(context, question.name)) {
      return MessageEncoder::ResultType::bad;
    }
    RawQuestion raw_question;
    raw_question.QTYPE = endian::native_to_big(question.type);
    raw_question.QCLASS = endian::native_to_big(question.the_class);
    auto raw = reinterpret_cast<const uint8_t*>(&raw_question);
    buffer.insert(buffer.end(), raw, raw + sizeof(RawQuestion));
  }

  for (auto section :
       {&message.answers, &message.authorities, &message.additional}) {
    for (auto& record : *section) {
      auto result = EncodeResourceRecord(context, record);
      if (result != ResultType::good) {
        return result;
      }
    }
  }

  if (buffer.size() - offset > std::numeric_limits<uint16_t>::max()) {
    return ResultType::bad;
  }
  return ResultType::good;
}

MessageEncoder::ResultType MessageEncoder::EncodeTcpMessage(
    const Message& message, std::vector<uint8_t>& buffer) {
  constexpr auto prefix_size = offsetof(RawTcpMessage, message);
  auto result = Encode(message, buffer, prefix_size);
  if (result != ResultType::good) {
    return result;
  }
  RawTcpMessage tcp_header;
  SAFE_SET_INT(tcp_header.message_length, buffer.size() - prefix_size);
  std::copy_n(reinterpret_cast<const uint8_t*>(&tcp_header), prefix_size,
              buffer.begin());
  return ResultType::good;
}

inline void EncodeLabels(MessageEncoderContext& context,
                         const vector<string>& labels) {
  auto& buffer = context.buffer;
  for (size_t i = 0; i < labels.size(); i++) {
    string suffix;
    for (auto j = i; j < labels.size(); j++) {
      suffix += EscapeLabel(reinterpret_cast<const uint8_t*>(labels[j].data()),
                            labels[j].size());
      suffix += '.';
    }
    suffix = LowercaseName(suffix);

    auto found = context.encoded_labels.find(suffix);
    if (found != context.encoded_labels.end()) {
      // rfc1035 4.1.4. Message compression
      buffer.push_back(RawLabel::Flag::OFFSET | ((found->second >> 8) & 0x3F));
      buffer.push_back(found->second & 0xFF);
      return;
    }

    auto label_offset = buffer.size() - context.message_offset;
    if (label_offset <= RawLabel::kMaxOffset) {
      context.encoded_labels.emplace(std::move(suffix), label_offset);
    }
    buffer.push_back(static_cast<uint8_t>(labels[i].size()));
    buffer.insert(buffer.end(), labels[i].begin(), labels[i].end());
  }
  buffer.push_back(0);
}

inline bool EncodeName(MessageEncoderContext& context, const string& name) {
  vector<string> labels;
  if (!SplitLabels(name, labels)) {
    return false;
  }
  EncodeLabels(context, labels);
  return true;
}

// Reads an uncompressed wire name from rdata starting at offset.
inline bool ReadRdataLabels(const vector<uint8_t>& rdata, size_t& offset,
                            vector<string>& labels) {
  while (offset < rdata.size()) {
    size_t size = rdata[offset++];
    if (size == 0) {
      return true;
    }
    if (size > RawLabel::kMaxLength || offset + size > rdata.size()) {
      return false;
    }
    labels.emplace_back(rdata.begin() + offset, rdata.begin() + offset + size);
    offset += size;
  }
  return false;
}

// Writes the RDATA of the rfc1035 types with their names compressed, other
// types are copied as they are (rfc3597 4).
inline MessageEncoder::ResultType EncodeRdata(MessageEncoderContext& context,
                                              const ResourceRecord& record) {
  auto& rdata = record.rdata;
  size_t prefix_size = 0;
  size_t name_count = 0;
  size_t suffix_size = 0;
  switch (static_cast<TYPE>(record.type)) {
    case TYPE::NS:
    case TYPE::MD:
    case TYPE::MF:
    case TYPE::CNAME:
    case TYPE::MB:
    case TYPE::MG:
    case TYPE::MR:
    case TYPE::PTR:
      name_count = 1;
      break;
    case TYPE::MINFO:
      name_count = 2;
      break;
    case TYPE::MX:
      prefix_size = 2;
      name_count = 1;
      break;
    case TYPE::SOA:
      name_count = 2;
      suffix_size = 20;
      break;
    default:
      context.buffer.insert(context.buffer.end(), rdata.begin(), rdata.end());
      return MessageEncoder::ResultType::good;
  }

  if (prefix_size > rdata.size()) {
    return MessageEncoder::ResultType::bad;
  }
  context.buffer.insert(context.buffer.end(), rdata.begin(),
                        rdata.begin() + prefix_size);
  size_t offset = prefix_size;
  for (size_t i = 0; i < name_count; i++) {
    vector<string> labels;
    if (!ReadRdataLabels(rdata, offset, labels)) {
      return MessageEncoder::ResultType::bad;
    }
    EncodeLabels(context, labels);
  }
  if (offset + suffix_size != rdata.size()) {
    return MessageEncoder::ResultType::bad;
  }
  context.buffer.insert(context.buffer.end(), rdata.begin() + offset,
                        rdata.end());
  return MessageEncoder::ResultType::good;
}

inline MessageEncoder::ResultType EncodeResourceRecord(
    MessageEncoderContext& context, const ResourceRecord& record) {
  if (!EncodeName(context, record.name)) {
    return MessageEncoder::ResultType::bad;
  }

  RawResourceRecord raw_record;
  raw_record.TYPE = endian::native_to_big(record.type);
  raw_record.CLASS = endian::native_to_big(record.the_class);
  raw_record.TTL = endian::native_to_big(record.ttl);
  raw_record.RDLENGTH = 0;
  auto raw = reinterpret_cast<const uint8_t*>(&raw_record);
  auto record_offset = context.buffer.size();
  context.buffer.insert(context.buffer.end(), raw,
                        raw + sizeof(RawResourceRecord));
  auto rdata_offset = context.buffer.size();
  auto result = EncodeRdata(context, record);
  if (result != MessageEncoder::ResultType::good) {
    return result;
  }
  // RDLENGTH is known once the names are compressed
  uint16_t rdata_length;
  SAFE_SET_INT(rdata_length, context.buffer.size() - rdata_offset);
  std::copy_n(reinterpret_cast<const uint8_t*>(&rdata_length),
              sizeof(rdata_length),
              context.buffer.begin() + record_offset +
                  offsetof(RawResourceRecord, RDLENGTH));
  return MessageEncoder::ResultType::good;
}

}  // namespace dns
}  // namespace dnsprobe
