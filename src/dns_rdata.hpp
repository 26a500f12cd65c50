#ifndef DNSPROBE_DNS_RDATA_H_
#define DNSPROBE_DNS_RDATA_H_

#include <boost/asio/ip/address.hpp>
#include <string>
#include <string_view>
#include <vector>
#include "dns_definition.hpp"

namespace dnsprobe {
namespace dns {
namespace rdata {

// RDATA handled here is self contained: names are uncompressed, which is what
// MessageDecoder leaves behind.

struct Soa {
  std::string mname;
  std::string rname;
  uint32_t serial = 0;
  uint32_t refresh = 0;
  uint32_t retry = 0;
  uint32_t expire = 0;
  uint32_t minimum = 0;
};

std::vector<uint8_t> FromAddress(const boost::asio::ip::address& address);
bool FromName(std::string_view name, std::vector<uint8_t>& rdata);
bool FromSoa(const Soa& soa, std::vector<uint8_t>& rdata);
bool FromMx(uint16_t preference, std::string_view exchange,
            std::vector<uint8_t>& rdata);
std::vector<uint8_t> FromText(const std::vector<std::string>& strings);

bool ToAddress(uint16_t type, const std::vector<uint8_t>& rdata,
               boost::asio::ip::address& address);
// NS, CNAME, PTR, DNAME and the other single name types
bool ToName(const std::vector<uint8_t>& rdata, std::string& name);
bool ToSoa(const std::vector<uint8_t>& rdata, Soa& soa);

// Presentation format, rfc3597 "\# length hex" for types without one.
std::string ToString(uint16_t type, const std::vector<uint8_t>& rdata);

// rfc4034 6.2: names embedded in RDATA are lowercased. Malformed RDATA is
// returned as is.
std::vector<uint8_t> ToCanonical(uint16_t type,
                                 const std::vector<uint8_t>& rdata);

}  // namespace rdata
}  // namespace dns
}  // namespace dnsprobe
#endif  // DNSPROBE_DNS_RDATA_H_
