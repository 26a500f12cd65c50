#ifndef DNSPROBE_DNS_NAME_H_
#define DNSPROBE_DNS_NAME_H_

#include <boost/asio/ip/address.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace dnsprobe {
namespace dns {

// Names are kept in presentation format and are always absolute: labels are
// separated by '.', the root is ".", a label byte that is not printable or is
// a '.' or '\' is escaped (\. \\ \DDD).

// Splits a presentation name into raw label bytes, the root yields no label.
// Returns false on an empty label, a bad escape or an oversized label/name.
bool SplitLabels(std::string_view name, std::vector<std::string>& labels);

std::string JoinLabels(const std::vector<std::string>& labels);

std::string EscapeLabel(const uint8_t* data, size_t size);

// Adds the trailing dot and resolves escapes to their canonical spelling.
// An invalid name is returned unchanged.
std::string NormalizeName(std::string_view name);

// DNSSEC canonical ordering (rfc4034 6.1), case-insensitive
int CompareNames(std::string_view a, std::string_view b);

inline bool NameEquals(std::string_view a, std::string_view b) {
  return CompareNames(a, b) == 0;
}

std::string LowercaseName(std::string_view name);

// Appends the wire form of name without compression.
bool EncodeNameUncompressed(std::string_view name,
                            std::vector<uint8_t>& buffer);

// in-addr.arpa / ip6.arpa name used for PTR queries
std::string ReverseName(const boost::asio::ip::address& address);

}  // namespace dns
}  // namespace dnsprobe
#endif  // DNSPROBE_DNS_NAME_H_
