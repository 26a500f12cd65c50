#include <boost/endian/conversion.hpp>
#include <string>
#include <vector>
#include "dns.hpp"
#include "logging.hpp"

namespace endian = boost::endian;
using std::string;
using std::vector;

namespace dnsprobe {
namespace dns {

#define READ_FLAG(FLAGS_, FLAG_NAME_)                 \
  ((RawHeader::Flag::FLAG_NAME_##_mask & (FLAGS_)) >> \
   RawHeader::Flag::FLAG_NAME_##_offset)

MessageDecoder::ResultType MessageDecoder::DecodeCompleteMessage(
    Message& message, const uint8_t* buffer, size_t buffer_size) {
  return Decode(message, buffer, buffer_size, Mode::COMPLETE);
}

MessageDecoder::ResultType MessageDecoder::DecodeMessageLeniently(
    Message& message, const uint8_t* buffer, size_t buffer_size) {
  return Decode(message, buffer, buffer_size, Mode::LENIENT);
}

MessageDecoder::ResultType MessageDecoder::DecodeHeaderAndQuestions(
    Message& message, const uint8_t* buffer, size_t buffer_size) {
  return Decode(message, buffer, buffer_size, Mode::HEADER_AND_QUESTIONS);
}

MessageDecoder::ResultType MessageDecoder::Decode(Message& message,
                                                  const uint8_t* buffer,
                                                  size_t buffer_size,
                                                  Mode mode) {
  message.reset();
  size_t offset = 0;
  uint16_t answer_count;
  uint16_t authority_count;
  uint16_t additional_count;
  {
    if (buffer_size < offset + sizeof(RawHeader)) {
      return ResultType::bad;
    }
    // decode header
    auto& header = *reinterpret_cast<const RawHeader*>(buffer);
    message.header.id = endian::big_to_native(header.ID);
    message.header.is_response = READ_FLAG(header.FLAGS, QR);
    message.header.operation_code = READ_FLAG(header.FLAGS, Opcode);
    message.header.is_authoritative_answer = READ_FLAG(header.FLAGS, AA);
    message.header.is_truncated = READ_FLAG(header.FLAGS, TC);
    message.header.is_recursion_desired = READ_FLAG(header.FLAGS, RD);
    message.header.is_recursion_available = READ_FLAG(header.FLAGS, RA);
    message.header.z = READ_FLAG(header.FLAGS, Z);
    message.header.is_authentic_data = READ_FLAG(header.FLAGS, AD);
    message.header.is_checking_disabled = READ_FLAG(header.FLAGS, CD);
    message.header.response_code = READ_FLAG(header.FLAGS, RCODE);

    message.questions.resize(endian::big_to_native(header.QDCOUNT));
    answer_count = endian::big_to_native(header.ANCOUNT);
    authority_count = endian::big_to_native(header.NSCOUNT);
    additional_count = endian::big_to_native(header.ARCOUNT);
    offset += sizeof(RawHeader);
  }

  for (auto& question : message.questions) {
    auto result = DecodeQuestion(question, buffer, buffer_size, offset, offset);
    if (result != ResultType::good) {
      return result;
    }
  }

  if (mode == Mode::HEADER_AND_QUESTIONS) {
    return ResultType::good;
  }

  std::pair<vector<ResourceRecord>*, uint16_t> sections[] = {
      {&message.answers, answer_count},
      {&message.authorities, authority_count},
      {&message.additional, additional_count},
  };
  for (auto& section : sections) {
    auto& records = *section.first;
    records.reserve(section.second);
    for (uint16_t i = 0; i < section.second; i++) {
      ResourceRecord record;
      size_t rdata_offset;
      auto result = DecodeResourceRecord(record, buffer, buffer_size, offset,
                                         rdata_offset);
      if (result != ResultType::good) {
        if (mode == Mode::LENIENT) {
          LOG_DEBUG("record framing broken at " << offset);
          return ResultType::good;
        }
        return result;
      }
      offset = rdata_offset + record.rdata.size();
      result = ExpandRdata(record, buffer, buffer_size, rdata_offset);
      if (result != ResultType::good) {
        if (mode == Mode::LENIENT) {
          LOG_DEBUG("skip record " << record.name << " with bad rdata");
          continue;
        }
        return result;
      }
      records.emplace_back(std::move(record));
    }
  }
  return ResultType::good;
}

MessageDecoder::ResultType MessageDecoder::DecodeName(string& name,
                                                      const uint8_t* buffer,
                                                      size_t buffer_size,
                                                      size_t from_offset,
                                                      size_t& end_offset) {
  vector<string> labels;
  auto jumped = false;
  // every offset label must point before the label run it ends, so the walk
  // always terminates
  auto run_begin = from_offset;
  auto offset = from_offset;
  size_t wire_length = 1;
  while (true) {
    if (offset >= buffer_size) {
      return ResultType::bad;
    }
    auto flag = buffer[offset];
    switch (flag & RawLabel::Flag::MASK) {
      case RawLabel::Flag::OFFSET: {
        // rfc1035 4.1.4. Message compression
        constexpr auto label_size = 2;
        if (offset + label_size > buffer_size) {
          return ResultType::bad;
        }
        if (!jumped) {
          end_offset = offset + label_size;
        }
        size_t to_offset =
            ((flag & ~RawLabel::Flag::MASK) << 8) | buffer[offset + 1];
        if (to_offset >= run_begin) {
          // offset should point to the label occured before
          return ResultType::bad;
        }
        offset = to_offset;
        run_begin = to_offset;
        jumped = true;
      } break;
      case RawLabel::Flag::NORMAL: {
        const size_t data_length = flag;
        if (data_length == 0) {
          if (!jumped) {
            end_offset = offset + 1;
          }
          name = JoinLabels(labels);
          return ResultType::good;
        }
        if (offset + 1 + data_length > buffer_size) {
          return ResultType::bad;
        }
        wire_length += data_length + 1;
        if (wire_length > RawLabel::kMaxNameLength) {
          return ResultType::bad;
        }
        labels.emplace_back(
            reinterpret_cast<const char*>(buffer + offset + 1), data_length);
        offset += 1 + data_length;
      } break;
      default:
        // rfc1035 4.1.4: 0x40/0x80 reserved for future
        return ResultType::bad;
    }
  }
}

inline MessageDecoder::ResultType MessageDecoder::DecodeQuestion(
    Question& question, const uint8_t* buffer, size_t buffer_size,
    size_t from_offset, size_t& end_offset) {
  auto result =
      DecodeName(question.name, buffer, buffer_size, from_offset, from_offset);
  if (result != ResultType::good) {
    return ResultType::bad;
  }

  if (from_offset + sizeof(RawQuestion) > buffer_size) {
    return ResultType::bad;
  }
  auto raw_question =
      reinterpret_cast<const RawQuestion*>(buffer + from_offset);
  question.type = endian::big_to_native(raw_question->QTYPE);
  question.the_class = endian::big_to_native(raw_question->QCLASS);
  end_offset = from_offset + sizeof(RawQuestion);
  return ResultType::good;
}

// end_offset is where RDATA begins
inline MessageDecoder::ResultType MessageDecoder::DecodeResourceRecord(
    ResourceRecord& record, const uint8_t* buffer, size_t buffer_size,
    size_t from_offset, size_t& end_offset) {
  auto result =
      DecodeName(record.name, buffer, buffer_size, from_offset, from_offset);
  if (result != ResultType::good) {
    return ResultType::bad;
  }
  if (from_offset + sizeof(RawResourceRecord) > buffer_size) {
    return ResultType::bad;
  }
  auto raw_record =
      reinterpret_cast<const RawResourceRecord*>(buffer + from_offset);
  record.type = endian::big_to_native(raw_record->TYPE);
  record.the_class = endian::big_to_native(raw_record->CLASS);
  record.ttl = endian::big_to_native(raw_record->TTL);
  size_t rdata_size = endian::big_to_native(raw_record->RDLENGTH);

  auto rdata_offset = from_offset + sizeof(RawResourceRecord);
  if (rdata_offset + rdata_size > buffer_size) {
    return ResultType::bad;
  }
  record.rdata.assign(buffer + rdata_offset,
                      buffer + rdata_offset + rdata_size);
  end_offset = rdata_offset;
  return ResultType::good;
}

// Names inside the RDATA of the rfc1035 types may be compressed, rewrite them
// uncompressed so the record no longer depends on the message buffer.
MessageDecoder::ResultType MessageDecoder::ExpandRdata(ResourceRecord& record,
                                                       const uint8_t* buffer,
                                                       size_t buffer_size,
                                                       size_t rdata_offset) {
  const auto rdata_end = rdata_offset + record.rdata.size();
  // sizes of the fixed fields before and after the names
  size_t prefix_size = 0;
  size_t name_count = 0;
  size_t suffix_size = 0;
  switch (static_cast<TYPE>(record.type)) {
    case TYPE::A:
      return record.rdata.size() == 4 ? ResultType::good : ResultType::bad;
    case TYPE::AAAA:
      return record.rdata.size() == 16 ? ResultType::good : ResultType::bad;
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
      return ResultType::good;
  }

  vector<uint8_t> expanded;
  expanded.reserve(record.rdata.size());
  auto offset = rdata_offset;
  if (offset + prefix_size > rdata_end) {
    return ResultType::bad;
  }
  expanded.insert(expanded.end(), buffer + offset,
                  buffer + offset + prefix_size);
  offset += prefix_size;
  for (size_t i = 0; i < name_count; i++) {
    string name;
    // names must not run past RDLENGTH
    auto result = DecodeName(name, buffer, rdata_end, offset, offset);
    if (result != ResultType::good ||
        !EncodeNameUncompressed(name, expanded)) {
      return ResultType::bad;
    }
  }
  if (offset + suffix_size != rdata_end) {
    return ResultType::bad;
  }
  expanded.insert(expanded.end(), buffer + offset, buffer + rdata_end);
  record.rdata = std::move(expanded);
  return ResultType::good;
}

MessageDecoder::ResultType MessageDecoder::ReadMessageSizeFromTcpMessage(
    const uint8_t* buffer, size_t buffer_size, uint16_t& size) {
  constexpr auto read_size = sizeof(RawTcpMessage::message_length);
  if (buffer_size < read_size) {
    return ResultType::indeterminate;
  }
  size = endian::big_to_native(
      reinterpret_cast<const RawTcpMessage*>(buffer)->message_length);
  return ResultType::good;
}

}  // namespace dns
}  // namespace dnsprobe
