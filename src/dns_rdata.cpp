#include "dns_rdata.hpp"

#include <algorithm>
#include <boost/endian/conversion.hpp>
#include <cstdio>
#include <cstring>
#include <sstream>
#include "dns_name.hpp"

namespace endian = boost::endian;
using boost::asio::ip::address;
using boost::asio::ip::address_v4;
using boost::asio::ip::address_v6;
using std::string;
using std::string_view;
using std::vector;

namespace dnsprobe {
namespace dns {
namespace rdata {

namespace {

inline uint16_t ReadUint16(const uint8_t* data) {
  uint16_t value;
  std::memcpy(&value, data, sizeof(value));
  return endian::big_to_native(value);
}

inline uint32_t ReadUint32(const uint8_t* data) {
  uint32_t value;
  std::memcpy(&value, data, sizeof(value));
  return endian::big_to_native(value);
}

inline void AppendUint16(vector<uint8_t>& buffer, uint16_t value) {
  value = endian::native_to_big(value);
  auto raw = reinterpret_cast<const uint8_t*>(&value);
  buffer.insert(buffer.end(), raw, raw + sizeof(value));
}

inline void AppendUint32(vector<uint8_t>& buffer, uint32_t value) {
  value = endian::native_to_big(value);
  auto raw = reinterpret_cast<const uint8_t*>(&value);
  buffer.insert(buffer.end(), raw, raw + sizeof(value));
}

// reads an uncompressed name, offset is moved past it
bool ReadName(const vector<uint8_t>& rdata, size_t& offset,
              vector<string>& labels) {
  labels.clear();
  while (offset < rdata.size()) {
    size_t length = rdata[offset];
    if (length == 0) {
      offset++;
      return true;
    }
    if ((length & RawLabel::Flag::MASK) != RawLabel::Flag::NORMAL ||
        offset + 1 + length > rdata.size()) {
      return false;
    }
    labels.emplace_back(reinterpret_cast<const char*>(&rdata[offset + 1]),
                        length);
    offset += 1 + length;
  }
  return false;
}

bool ReadName(const vector<uint8_t>& rdata, size_t& offset, string& name) {
  vector<string> labels;
  if (!ReadName(rdata, offset, labels)) {
    return false;
  }
  name = JoinLabels(labels);
  return true;
}

// fixed field sizes around the embedded names of a type
struct NameLayout {
  size_t prefix_size;
  size_t name_count;
};

bool GetNameLayout(uint16_t type, NameLayout& layout) {
  switch (static_cast<TYPE>(type)) {
    case TYPE::NS:
    case TYPE::MD:
    case TYPE::MF:
    case TYPE::CNAME:
    case TYPE::MB:
    case TYPE::MG:
    case TYPE::MR:
    case TYPE::PTR:
    case TYPE::DNAME:
      layout = {0, 1};
      return true;
    case TYPE::SOA:
    case TYPE::MINFO:
      layout = {0, 2};
      return true;
    case TYPE::MX:
      layout = {2, 1};
      return true;
    case TYPE::SRV:
      layout = {6, 1};
      return true;
    default:
      return false;
  }
}

string ToHex(const uint8_t* data, size_t size) {
  static constexpr char kHexDigits[] = "0123456789ABCDEF";
  string result;
  result.reserve(size * 2);
  for (size_t i = 0; i < size; i++) {
    result += kHexDigits[data[i] >> 4];
    result += kHexDigits[data[i] & 0x0F];
  }
  return result;
}

string GenericToString(const vector<uint8_t>& rdata) {
  string result = "\\# " + std::to_string(rdata.size());
  if (!rdata.empty()) {
    result += ' ';
    result += ToHex(rdata.data(), rdata.size());
  }
  return result;
}

string QuoteCharacterString(const uint8_t* data, size_t size) {
  string result = "\"";
  for (size_t i = 0; i < size; i++) {
    auto c = data[i];
    if (c == '"' || c == '\\') {
      result += '\\';
      result += static_cast<char>(c);
    } else if (c < 0x20 || c > 0x7E) {
      char escaped[5];
      std::snprintf(escaped, sizeof(escaped), "\\%03u",
                    static_cast<unsigned>(c));
      result += escaped;
    } else {
      result += static_cast<char>(c);
    }
  }
  result += '"';
  return result;
}

}  // namespace

vector<uint8_t> FromAddress(const address& ip_address) {
  if (ip_address.is_v4()) {
    auto bytes = ip_address.to_v4().to_bytes();
    return vector<uint8_t>(bytes.begin(), bytes.end());
  }
  auto bytes = ip_address.to_v6().to_bytes();
  return vector<uint8_t>(bytes.begin(), bytes.end());
}

bool FromName(string_view name, vector<uint8_t>& rdata) {
  rdata.clear();
  return EncodeNameUncompressed(name, rdata);
}

bool FromSoa(const Soa& soa, vector<uint8_t>& rdata) {
  rdata.clear();
  if (!EncodeNameUncompressed(soa.mname, rdata) ||
      !EncodeNameUncompressed(soa.rname, rdata)) {
    return false;
  }
  AppendUint32(rdata, soa.serial);
  AppendUint32(rdata, soa.refresh);
  AppendUint32(rdata, soa.retry);
  AppendUint32(rdata, soa.expire);
  AppendUint32(rdata, soa.minimum);
  return true;
}

bool FromMx(uint16_t preference, string_view exchange, vector<uint8_t>& rdata) {
  rdata.clear();
  AppendUint16(rdata, preference);
  return EncodeNameUncompressed(exchange, rdata);
}

vector<uint8_t> FromText(const vector<string>& strings) {
  vector<uint8_t> rdata;
  for (auto& text : strings) {
    auto size = std::min<size_t>(text.size(), 255);
    rdata.push_back(static_cast<uint8_t>(size));
    rdata.insert(rdata.end(), text.begin(), text.begin() + size);
  }
  return rdata;
}

bool ToAddress(uint16_t type, const vector<uint8_t>& rdata, address& result) {
  if (type == ToInt(TYPE::A) && rdata.size() == 4) {
    address_v4::bytes_type bytes;
    std::copy(rdata.begin(), rdata.end(), bytes.begin());
    result = address_v4(bytes);
    return true;
  }
  if (type == ToInt(TYPE::AAAA) && rdata.size() == 16) {
    address_v6::bytes_type bytes;
    std::copy(rdata.begin(), rdata.end(), bytes.begin());
    result = address_v6(bytes);
    return true;
  }
  return false;
}

bool ToName(const vector<uint8_t>& rdata, string& name) {
  size_t offset = 0;
  return ReadName(rdata, offset, name) && offset == rdata.size();
}

bool ToSoa(const vector<uint8_t>& rdata, Soa& soa) {
  size_t offset = 0;
  if (!ReadName(rdata, offset, soa.mname) ||
      !ReadName(rdata, offset, soa.rname) || offset + 20 != rdata.size()) {
    return false;
  }
  auto data = rdata.data() + offset;
  soa.serial = ReadUint32(data);
  soa.refresh = ReadUint32(data + 4);
  soa.retry = ReadUint32(data + 8);
  soa.expire = ReadUint32(data + 12);
  soa.minimum = ReadUint32(data + 16);
  return true;
}

string ToString(uint16_t type, const vector<uint8_t>& rdata) {
  std::ostringstream os;
  switch (static_cast<TYPE>(type)) {
    case TYPE::A:
    case TYPE::AAAA: {
      address result;
      if (!ToAddress(type, rdata, result)) {
        break;
      }
      return result.to_string();
    }
    case TYPE::NS:
    case TYPE::MD:
    case TYPE::MF:
    case TYPE::CNAME:
    case TYPE::MB:
    case TYPE::MG:
    case TYPE::MR:
    case TYPE::PTR:
    case TYPE::DNAME: {
      string name;
      if (!ToName(rdata, name)) {
        break;
      }
      return name;
    }
    case TYPE::MINFO: {
      size_t offset = 0;
      string rmailbx;
      string emailbx;
      if (!ReadName(rdata, offset, rmailbx) ||
          !ReadName(rdata, offset, emailbx) || offset != rdata.size()) {
        break;
      }
      return rmailbx + " " + emailbx;
    }
    case TYPE::MX: {
      size_t offset = 2;
      string exchange;
      if (rdata.size() < 3 || !ReadName(rdata, offset, exchange) ||
          offset != rdata.size()) {
        break;
      }
      os << ReadUint16(rdata.data()) << " " << exchange;
      return os.str();
    }
    case TYPE::SOA: {
      Soa soa;
      if (!ToSoa(rdata, soa)) {
        break;
      }
      os << soa.mname << " " << soa.rname << " " << soa.serial << " "
         << soa.refresh << " " << soa.retry << " " << soa.expire << " "
         << soa.minimum;
      return os.str();
    }
    case TYPE::TXT: {
      string result;
      size_t offset = 0;
      while (offset < rdata.size()) {
        size_t length = rdata[offset];
        if (offset + 1 + length > rdata.size()) {
          return GenericToString(rdata);
        }
        if (!result.empty()) {
          result += ' ';
        }
        result += QuoteCharacterString(&rdata[offset + 1], length);
        offset += 1 + length;
      }
      if (result.empty()) {
        break;
      }
      return result;
    }
    case TYPE::SRV: {
      size_t offset = 6;
      string target;
      if (rdata.size() < 7 || !ReadName(rdata, offset, target) ||
          offset != rdata.size()) {
        break;
      }
      os << ReadUint16(rdata.data()) << " " << ReadUint16(rdata.data() + 2)
         << " " << ReadUint16(rdata.data() + 4) << " " << target;
      return os.str();
    }
    default:
      break;
  }
  return GenericToString(rdata);
}

vector<uint8_t> ToCanonical(uint16_t type, const vector<uint8_t>& rdata) {
  NameLayout layout;
  if (!GetNameLayout(type, layout) || rdata.size() < layout.prefix_size) {
    return rdata;
  }
  vector<uint8_t> result(rdata.begin(), rdata.begin() + layout.prefix_size);
  size_t offset = layout.prefix_size;
  for (size_t i = 0; i < layout.name_count; i++) {
    vector<string> labels;
    if (!ReadName(rdata, offset, labels)) {
      return rdata;
    }
    for (auto& label : labels) {
      result.push_back(static_cast<uint8_t>(label.size()));
      for (auto c : label) {
        result.push_back(
            static_cast<uint8_t>((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c));
      }
    }
    result.push_back(0);
  }
  result.insert(result.end(), rdata.begin() + offset, rdata.end());
  return result;
}

}  // namespace rdata
}  // namespace dns
}  // namespace dnsprobe
