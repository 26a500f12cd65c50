#include "request.hpp"

#include <random>
#include "logging.hpp"

namespace dnsprobe {

RequestMessage RequestMessage::Create(const std::string& qname, uint16_t qtype,
                                      const RequestFlags& flags) {
  RequestMessage request;
  request.question_.name = dns::NormalizeName(qname);
  request.question_.type = qtype;
  request.question_.the_class = dns::ToInt(dns::CLASS::IN);
  request.flags_ = flags;
  return request;
}

RequestMessage RequestMessage::CreateXfr(const std::string& zone,
                                         std::optional<uint32_t> ixfr_serial) {
  RequestFlags flags;
  flags.recursion_desired = false;
  auto request = Create(
      zone, dns::ToInt(ixfr_serial ? dns::TYPE::Q_IXFR : dns::TYPE::Q_AXFR),
      flags);
  request.ixfr_serial_ = ixfr_serial;
  return request;
}

uint16_t RequestMessage::RandomId() {
  static thread_local std::mt19937 generator{std::random_device()()};
  std::uniform_int_distribution<uint16_t> distribution;
  return distribution(generator);
}

dns::MessageEncoder::ResultType RequestMessage::Encode(
    uint16_t id, uint16_t udp_payload_size, Framing framing,
    std::vector<uint8_t>& buffer) const {
  dns::Message message;
  message.header.id = id;
  message.header.operation_code = dns::ToInt(dns::OPCODE::QUERY);
  message.header.is_recursion_desired = flags_.recursion_desired;
  message.header.is_checking_disabled = flags_.checking_disabled;
  message.header.is_authentic_data = flags_.authentic_data;
  message.questions.push_back(question_);

  if (ixfr_serial_) {
    // rfc1995 3. the current version of the zone the client has
    dns::rdata::Soa soa;
    soa.mname = ".";
    soa.rname = ".";
    soa.serial = *ixfr_serial_;
    dns::ResourceRecord record;
    record.name = question_.name;
    record.type = dns::ToInt(dns::TYPE::SOA);
    record.the_class = question_.the_class;
    if (!dns::rdata::FromSoa(soa, record.rdata)) {
      return dns::MessageEncoder::ResultType::bad;
    }
    message.authorities.push_back(std::move(record));
  }

  if (framing == Framing::DATAGRAM || flags_.dnssec_ok) {
    dns::Edns edns;
    edns.udp_payload_size = udp_payload_size;
    edns.dnssec_ok = flags_.dnssec_ok;
    message.additional.push_back(edns.ToResourceRecord());
  }

  LOG_TRACE(<< question_.name << " " << message);
  if (framing == Framing::STREAM) {
    return dns::MessageEncoder::EncodeTcpMessage(message, buffer);
  }
  return dns::MessageEncoder::Encode(message, buffer, 0);
}

bool RequestMessage::Accepts(const dns::Message& response, uint16_t id,
                             bool allow_empty_question) const {
  if (!response.header.is_response || response.header.id != id) {
    return false;
  }
  if (response.questions.empty()) {
    return allow_empty_question;
  }
  if (response.questions.size() != 1) {
    return false;
  }
  auto& question = response.questions.front();
  return question.type == question_.type &&
         question.the_class == question_.the_class &&
         dns::NameEquals(question.name, question_.name);
}

bool RequestMessage::Accepts(const uint8_t* data, size_t size, uint16_t id,
                             bool allow_empty_question) const {
  dns::Message response;
  if (dns::MessageDecoder::DecodeHeaderAndQuestions(response, data, size) !=
      dns::MessageDecoder::ResultType::good) {
    return false;
  }
  return Accepts(response, id, allow_empty_question);
}

bool RequestMessage::is_streaming() const {
  return question_.type == dns::ToInt(dns::TYPE::Q_AXFR) ||
         question_.type == dns::ToInt(dns::TYPE::Q_IXFR);
}

}  // namespace dnsprobe
