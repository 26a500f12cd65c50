#ifndef DNSPROBE_DNS_DEFINITION_RAW_H_
#define DNSPROBE_DNS_DEFINITION_RAW_H_
#include <boost/endian/conversion.hpp>
#include <cstddef>
#include <cstdint>

namespace dnsprobe {
namespace dns {
#pragma pack(push, 1)

// rfc1035 4.2.2. TCP usage
struct RawTcpMessage {
  uint16_t message_length;
  uint8_t message[];
};

struct RawHeader {
#if BOOST_ENDIAN_BIG_BYTE
  struct Flag {
    static constexpr uint16_t QR_mask = 0b1000000000000000;
    static constexpr uint16_t QR_offset = 15;
    static constexpr uint16_t Opcode_mask = 0b0111100000000000;
    static constexpr uint16_t Opcode_offset = 11;
    static constexpr uint16_t AA_mask = 0b0000010000000000;
    static constexpr uint16_t AA_offset = 10;
    static constexpr uint16_t TC_mask = 0b0000001000000000;
    static constexpr uint16_t TC_offset = 9;
    static constexpr uint16_t RD_mask = 0b0000000100000000;
    static constexpr uint16_t RD_offset = 8;
    static constexpr uint16_t RA_mask = 0b0000000010000000;
    static constexpr uint16_t RA_offset = 7;
    static constexpr uint16_t Z_mask = 0b0000000001000000;
    static constexpr uint16_t Z_offset = 6;
    static constexpr uint16_t AD_mask = 0b0000000000100000;
    static constexpr uint16_t AD_offset = 5;
    static constexpr uint16_t CD_mask = 0b0000000000010000;
    static constexpr uint16_t CD_offset = 4;
    static constexpr uint16_t RCODE_mask = 0b0000000000001111;
    static constexpr uint16_t RCODE_offset = 0;
  };
#else
  struct Flag {
    static constexpr uint16_t QR_mask = 0b0000000010000000;
    static constexpr uint16_t QR_offset = 7;
    static constexpr uint16_t Opcode_mask = 0b0000000001111000;
    static constexpr uint16_t Opcode_offset = 3;
    static constexpr uint16_t AA_mask = 0b0000000000000100;
    static constexpr uint16_t AA_offset = 2;
    static constexpr uint16_t TC_mask = 0b0000000000000010;
    static constexpr uint16_t TC_offset = 1;
    static constexpr uint16_t RD_mask = 0b0000000000000001;
    static constexpr uint16_t RD_offset = 0;
    static constexpr uint16_t RA_mask = 0b1000000000000000;
    static constexpr uint16_t RA_offset = 15;
    static constexpr uint16_t Z_mask = 0b0100000000000000;
    static constexpr uint16_t Z_offset = 14;
    static constexpr uint16_t AD_mask = 0b0010000000000000;
    static constexpr uint16_t AD_offset = 13;
    static constexpr uint16_t CD_mask = 0b0001000000000000;
    static constexpr uint16_t CD_offset = 12;
    static constexpr uint16_t RCODE_mask = 0b0000111100000000;
    static constexpr uint16_t RCODE_offset = 8;
  };
#endif
  uint16_t ID;
  uint16_t FLAGS;
  /* FLAGS:
    int8_t QR:1;
    int8_t Opcode:4;
    int8_t AA:1;
    int8_t TC:1;
    int8_t RD:1;
    int8_t RA:1;
    int8_t Z:1;
    int8_t AD:1;
    int8_t CD:1;
    int8_t RCODE:4;
    not using bit field because the order of allocation of bit-fields within a
    unit is implementation-defined.
  */
  uint16_t QDCOUNT;
  uint16_t ANCOUNT;
  uint16_t NSCOUNT;
  uint16_t ARCOUNT;
};

struct RawLabel {
  struct Flag {
    static constexpr uint8_t MASK =
        0b11000000;  // not a flag, flag value = (flag & MASK)
    static constexpr uint8_t NORMAL = 0b00000000;
    static constexpr uint8_t OFFSET = 0b11000000;
    static constexpr uint8_t RESERVED1 = 0b01000000;
    static constexpr uint8_t RESERVED2 = 0b10000000;
  };
  static constexpr uint8_t kMaxLength = 63;
  static constexpr size_t kMaxNameLength = 255;
  static constexpr uint16_t kMaxOffset = 0x3FFF;
};

// fields following QNAME
struct RawQuestion {
  uint16_t QTYPE;
  uint16_t QCLASS;
};

// fields following NAME, RDATA comes right after RDLENGTH
struct RawResourceRecord {
  uint16_t TYPE;
  uint16_t CLASS;
  uint32_t TTL;
  uint16_t RDLENGTH;
};

#pragma pack(pop)
}  // namespace dns
}  // namespace dnsprobe
#endif  // DNSPROBE_DNS_DEFINITION_RAW_H_
