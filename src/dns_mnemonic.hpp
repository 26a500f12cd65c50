#ifndef DNSPROBE_DNS_MNEMONIC_H_
#define DNSPROBE_DNS_MNEMONIC_H_

#include <string>
#include <string_view>
#include "dns_definition.hpp"

namespace dnsprobe {
namespace dns {

// rfc3597 TYPEnnn / CLASSnnn for values without a mnemonic
std::string TypeToString(uint16_t type);
std::string ClassToString(uint16_t the_class);
std::string RcodeToString(uint16_t rcode);
std::string OpcodeToString(uint16_t opcode);
// dig style "qr aa rd ra"
std::string FlagsToString(const Header& header);

// case-insensitive, also accepts TYPEnnn
bool ParseType(std::string_view text, uint16_t& type);

}  // namespace dns
}  // namespace dnsprobe
#endif  // DNSPROBE_DNS_MNEMONIC_H_
