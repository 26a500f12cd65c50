#include "dns_mnemonic.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <utility>

using std::string;
using std::string_view;

namespace dnsprobe {
namespace dns {

namespace {

constexpr std::pair<TYPE, const char*> kTypeNames[] = {
    {TYPE::A, "A"},           {TYPE::NS, "NS"},         {TYPE::MD, "MD"},
    {TYPE::MF, "MF"},         {TYPE::CNAME, "CNAME"},   {TYPE::SOA, "SOA"},
    {TYPE::MB, "MB"},         {TYPE::MG, "MG"},         {TYPE::MR, "MR"},
    {TYPE::NULL_, "NULL"},    {TYPE::WKS, "WKS"},       {TYPE::PTR, "PTR"},
    {TYPE::HINFO, "HINFO"},   {TYPE::MINFO, "MINFO"},   {TYPE::MX, "MX"},
    {TYPE::TXT, "TXT"},       {TYPE::AAAA, "AAAA"},     {TYPE::SRV, "SRV"},
    {TYPE::DNAME, "DNAME"},   {TYPE::OPT, "OPT"},       {TYPE::DS, "DS"},
    {TYPE::RRSIG, "RRSIG"},   {TYPE::NSEC, "NSEC"},     {TYPE::DNSKEY, "DNSKEY"},
    {TYPE::Q_IXFR, "IXFR"},   {TYPE::Q_AXFR, "AXFR"},   {TYPE::Q_MAILB, "MAILB"},
    {TYPE::Q_MAILA, "MAILA"}, {TYPE::Q_ALL, "ANY"},     {TYPE::CAA, "CAA"},
};

constexpr std::pair<CLASS, const char*> kClassNames[] = {
    {CLASS::IN, "IN"},         {CLASS::CS, "CS"},       {CLASS::CH, "CH"},
    {CLASS::HS, "HS"},         {CLASS::Q_NONE, "NONE"}, {CLASS::Q_ALL, "ANY"},
};

constexpr const char* kRcodeNames[] = {
    "NOERROR", "FORMERR", "SERVFAIL", "NXDOMAIN", "NOTIMP", "REFUSED",
    "YXDOMAIN", "YXRRSET", "NXRRSET", "NOTAUTH", "NOTZONE",
};

constexpr const char* kOpcodeNames[] = {
    "QUERY", "IQUERY", "STATUS", "OPCODE3", "NOTIFY", "UPDATE",
};

bool EqualsIgnoreCase(string_view a, string_view b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::toupper(static_cast<unsigned char>(x)) ==
                  std::toupper(static_cast<unsigned char>(y));
         });
}

}  // namespace

string TypeToString(uint16_t type) {
  for (auto& entry : kTypeNames) {
    if (ToInt(entry.first) == type) {
      return entry.second;
    }
  }
  return "TYPE" + std::to_string(type);
}

string ClassToString(uint16_t the_class) {
  for (auto& entry : kClassNames) {
    if (ToInt(entry.first) == the_class) {
      return entry.second;
    }
  }
  return "CLASS" + std::to_string(the_class);
}

string RcodeToString(uint16_t rcode) {
  if (rcode < std::size(kRcodeNames)) {
    return kRcodeNames[rcode];
  }
  return "RCODE" + std::to_string(rcode);
}

string OpcodeToString(uint16_t opcode) {
  if (opcode < std::size(kOpcodeNames)) {
    return kOpcodeNames[opcode];
  }
  return "OPCODE" + std::to_string(opcode);
}

string FlagsToString(const Header& header) {
  string flags;
  auto append = [&flags](bool set, const char* name) {
    if (!set) {
      return;
    }
    if (!flags.empty()) {
      flags += ' ';
    }
    flags += name;
  };
  append(header.is_response, "qr");
  append(header.is_authoritative_answer, "aa");
  append(header.is_truncated, "tc");
  append(header.is_recursion_desired, "rd");
  append(header.is_recursion_available, "ra");
  append(header.is_authentic_data, "ad");
  append(header.is_checking_disabled, "cd");
  return flags;
}

bool ParseType(string_view text, uint16_t& type) {
  for (auto& entry : kTypeNames) {
    if (EqualsIgnoreCase(text, entry.second)) {
      type = ToInt(entry.first);
      return true;
    }
  }
  if (text.size() > 4 && EqualsIgnoreCase(text.substr(0, 4), "TYPE")) {
    uint32_t value = 0;
    for (auto c : text.substr(4)) {
      if (c < '0' || c > '9') {
        return false;
      }
      value = value * 10 + (c - '0');
      if (value > 0xFFFF) {
        return false;
      }
    }
    type = static_cast<uint16_t>(value);
    return true;
  }
  return false;
}

}  // namespace dns
}  // namespace dnsprobe
