#ifndef DNSPROBE_DNS_DEFINITION_H_
#define DNSPROBE_DNS_DEFINITION_H_
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include "dns_definition_raw.hpp"

namespace dnsprobe {
namespace dns {
// ref: rfc1035 4.1. Format

/*
 Values received from a server are kept as plain integers in the structs below
 so that unknown codes survive decoding and can be printed, the enums are for
 the values this client knows about.
 */

enum class OPCODE : uint16_t { QUERY = 0, IQUERY, STATUS, NOTIFY = 4, UPDATE };

enum class RCODE : uint16_t {
  SUCCESS = 0,
  FORMAT_ERROR,
  SERVER_FAILURE,
  NAME_ERROR,
  NOT_IMPLEMENTED,
  REFUSED,
  YXDOMAIN,
  YXRRSET,
  NXRRSET,
  NOTAUTH,
  NOTZONE,
};

enum class TYPE : uint16_t {
  A = 1,      // a host address
  NS,         // an authoritative name server
  MD,         // a mail destination (Obsolete - use MX)
  MF,         // a mail forwarder (Obsolete - use MX)
  CNAME,      // the canonical name for an alias
  SOA,        // marks the start of a zone of authority
  MB,         // a mailbox domain name (EXPERIMENTAL)
  MG,         // a mail group member (EXPERIMENTAL)
  MR,         // a mail rename domain name (EXPERIMENTAL)
  NULL_,      // a null RR (EXPERIMENTAL)
  WKS,        // a well known service description
  PTR,        // a domain name pointer
  HINFO,      // host information
  MINFO,      // mailbox or mail list information
  MX,         // mail exchange
  TXT,        // text strings
  AAAA = 28,  // IPv6 address
  SRV = 33,   // service locator
  DNAME = 39,
  OPT = 41,  // OPT PSEUDOSECTION
  DS = 43,
  RRSIG = 46,
  NSEC = 47,
  DNSKEY = 48,
  Q_IXFR = 251,  // incremental transfer (rfc1995)
  Q_AXFR = 252,  // A request for a transfer of an entire zone
  Q_MAILB,       // A request for mailbox-related records (MB, MG or MR)
  Q_MAILA,       // A request for mail agent RRs (Obsolete - see MX)
  Q_ALL,         // A request for all records
  CAA = 257,
};

enum class CLASS : uint16_t {
  IN = 1,  // the Internet
  CS,  // the CSNET class (Obsolete - used only for examples in some obsolete
       // RFCs)
  CH,  // the CHAOS class
  HS,  // Hesiod [Dyer 87]
  Q_NONE = 254,
  Q_ALL = 255,  // any class
};

constexpr uint16_t ToInt(TYPE type) { return static_cast<uint16_t>(type); }
constexpr uint16_t ToInt(CLASS the_class) {
  return static_cast<uint16_t>(the_class);
}
constexpr uint16_t ToInt(RCODE rcode) { return static_cast<uint16_t>(rcode); }
constexpr uint16_t ToInt(OPCODE opcode) {
  return static_cast<uint16_t>(opcode);
}

struct Question {
  std::string name;
  uint16_t type = 0;
  uint16_t the_class = ToInt(CLASS::IN);

  inline void reset() { name.clear(); }
};

struct ResourceRecord {
  std::string name;
  uint16_t type = 0;
  uint16_t the_class = ToInt(CLASS::IN);
  uint32_t ttl = 0;
  std::vector<uint8_t> rdata;

  inline void reset() {
    name.clear();
    rdata.clear();
  }
};

struct Header {
  uint16_t id = 0;
  bool is_response = false;
  uint16_t operation_code = 0;
  bool is_authoritative_answer = false;
  bool is_truncated = false;
  bool is_recursion_desired = false;
  bool is_recursion_available = false;
  uint16_t z = 0;
  bool is_authentic_data = false;
  bool is_checking_disabled = false;
  uint16_t response_code = 0;
};

// rfc6891 6.1.3. OPT Record TTL Field Use
struct Edns {
  static constexpr uint32_t kDnssecOkMask = 0x8000;
  uint16_t udp_payload_size = 1232;
  uint8_t extended_rcode = 0;
  uint8_t version = 0;
  bool dnssec_ok = false;
  std::vector<uint8_t> options;

  ResourceRecord ToResourceRecord() const;
  static Edns FromResourceRecord(const ResourceRecord& record);
};

struct Message {
  enum class Section {
    // custom enum, not part of rfc
    INVALID_VALUE,
    HEADER,
    QUESTION,
    ANSWER,
    AUTHORITY,
    ADDITIONAL,
  };
  Header header;
  std::vector<Question> questions;
  std::vector<ResourceRecord> answers;
  std::vector<ResourceRecord> authorities;
  std::vector<ResourceRecord> additional;

  void reset() {
    header = Header();
    questions.clear();
    answers.clear();
    authorities.clear();
    additional.clear();
  }

  // the first OPT record in the additional section
  std::optional<Edns> edns() const {
    for (auto& record : additional) {
      if (record.type == ToInt(TYPE::OPT)) {
        return Edns::FromResourceRecord(record);
      }
    }
    return std::nullopt;
  }

  friend std::ostream& operator<<(std::ostream& os, const Message& message) {
    os << "[" << message.header.id << "|"
       << (message.header.is_response ? "R" : "Q") << "|OP"
       << message.header.operation_code << "|AA"
       << message.header.is_authoritative_answer << "|TC"
       << message.header.is_truncated << "|RD"
       << message.header.is_recursion_desired << "|RA"
       << message.header.is_recursion_available << "|AD"
       << message.header.is_authentic_data << "|CD"
       << message.header.is_checking_disabled << "|RC"
       << message.header.response_code << "|" << message.questions.size()
       << "/" << message.answers.size() << "/" << message.authorities.size()
       << "/" << message.additional.size() << "]";
    return os;
  }
};

inline ResourceRecord Edns::ToResourceRecord() const {
  ResourceRecord record;
  record.name = ".";
  record.type = ToInt(TYPE::OPT);
  record.the_class = udp_payload_size;
  record.ttl = (static_cast<uint32_t>(extended_rcode) << 24) |
               (static_cast<uint32_t>(version) << 16) |
               (dnssec_ok ? kDnssecOkMask : 0);
  record.rdata = options;
  return record;
}

inline Edns Edns::FromResourceRecord(const ResourceRecord& record) {
  Edns edns;
  edns.udp_payload_size = record.the_class;
  edns.extended_rcode = (record.ttl >> 24) & 0xFF;
  edns.version = (record.ttl >> 16) & 0xFF;
  edns.dnssec_ok = record.ttl & kDnssecOkMask;
  edns.options = record.rdata;
  return edns;
}

}  // namespace dns
}  // namespace dnsprobe
#endif  // DNSPROBE_DNS_DEFINITION_H_
