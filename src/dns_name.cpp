#include "dns_name.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include "dns_definition_raw.hpp"

using std::string;
using std::string_view;
using std::vector;

namespace dnsprobe {
namespace dns {

namespace {

inline char AsciiLower(char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

inline bool IsDigit(char c) { return c >= '0' && c <= '9'; }

}  // namespace

bool SplitLabels(string_view name, vector<string>& labels) {
  labels.clear();
  if (name.empty() || name == ".") {
    return true;
  }
  size_t wire_length = 1;
  string label;
  size_t i = 0;
  while (i < name.size()) {
    auto c = name[i];
    if (c == '.') {
      if (label.empty()) {
        return false;
      }
      wire_length += label.size() + 1;
      labels.emplace_back(std::move(label));
      label.clear();
      i++;
      continue;
    }
    if (c == '\\') {
      if (i + 1 >= name.size()) {
        return false;
      }
      if (IsDigit(name[i + 1])) {
        if (i + 3 >= name.size() || !IsDigit(name[i + 2]) ||
            !IsDigit(name[i + 3])) {
          return false;
        }
        auto value = (name[i + 1] - '0') * 100 + (name[i + 2] - '0') * 10 +
                     (name[i + 3] - '0');
        if (value > 255) {
          return false;
        }
        label.push_back(static_cast<char>(value));
        i += 4;
      } else {
        label.push_back(name[i + 1]);
        i += 2;
      }
    } else {
      label.push_back(c);
      i++;
    }
    if (label.size() > RawLabel::kMaxLength) {
      return false;
    }
  }
  if (!label.empty()) {
    wire_length += label.size() + 1;
    labels.emplace_back(std::move(label));
  }
  return wire_length <= RawLabel::kMaxNameLength;
}

string EscapeLabel(const uint8_t* data, size_t size) {
  string result;
  result.reserve(size);
  for (size_t i = 0; i < size; i++) {
    auto c = data[i];
    if (c == '.' || c == '\\') {
      result.push_back('\\');
      result.push_back(static_cast<char>(c));
    } else if (c < 0x21 || c > 0x7E) {
      char escaped[5];
      std::snprintf(escaped, sizeof(escaped), "\\%03u",
                    static_cast<unsigned>(c));
      result.append(escaped);
    } else {
      result.push_back(static_cast<char>(c));
    }
  }
  return result;
}

string JoinLabels(const vector<string>& labels) {
  if (labels.empty()) {
    return ".";
  }
  string name;
  for (auto& label : labels) {
    name += EscapeLabel(reinterpret_cast<const uint8_t*>(label.data()),
                        label.size());
    name += '.';
  }
  return name;
}

string NormalizeName(string_view name) {
  vector<string> labels;
  if (!SplitLabels(name, labels)) {
    return string(name);
  }
  return JoinLabels(labels);
}

int CompareNames(string_view a, string_view b) {
  vector<string> left;
  vector<string> right;
  if (!SplitLabels(a, left) || !SplitLabels(b, right)) {
    auto lower_a = LowercaseName(a);
    auto lower_b = LowercaseName(b);
    return lower_a.compare(lower_b);
  }
  auto i = left.rbegin();
  auto j = right.rbegin();
  for (; i != left.rend() && j != right.rend(); ++i, ++j) {
    std::transform(i->begin(), i->end(), i->begin(), AsciiLower);
    std::transform(j->begin(), j->end(), j->begin(), AsciiLower);
    auto result = i->compare(*j);
    if (result != 0) {
      return result < 0 ? -1 : 1;
    }
  }
  if (i == left.rend() && j == right.rend()) {
    return 0;
  }
  // the name with fewer labels sorts first
  return i == left.rend() ? -1 : 1;
}

string LowercaseName(string_view name) {
  string result(name);
  std::transform(result.begin(), result.end(), result.begin(), AsciiLower);
  return result;
}

bool EncodeNameUncompressed(string_view name, vector<uint8_t>& buffer) {
  vector<string> labels;
  if (!SplitLabels(name, labels)) {
    return false;
  }
  for (auto& label : labels) {
    buffer.push_back(static_cast<uint8_t>(label.size()));
    buffer.insert(buffer.end(), label.begin(), label.end());
  }
  buffer.push_back(0);
  return true;
}

string ReverseName(const boost::asio::ip::address& address) {
  string name;
  if (address.is_v4()) {
    auto bytes = address.to_v4().to_bytes();
    for (auto i = bytes.rbegin(); i != bytes.rend(); ++i) {
      name += std::to_string(*i);
      name += '.';
    }
    name += "in-addr.arpa.";
    return name;
  }
  static constexpr char kHexDigits[] = "0123456789abcdef";
  auto bytes = address.to_v6().to_bytes();
  for (auto i = bytes.rbegin(); i != bytes.rend(); ++i) {
    name += kHexDigits[*i & 0x0F];
    name += '.';
    name += kHexDigits[(*i >> 4) & 0x0F];
    name += '.';
  }
  name += "ip6.arpa.";
  return name;
}

}  // namespace dns
}  // namespace dnsprobe
