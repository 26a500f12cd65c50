#ifndef DNSPROBE_DIFF_H_
#define DNSPROBE_DIFF_H_
#include <optional>
#include <ostream>
#include <vector>
#include "dns.hpp"

namespace dnsprobe {

enum class Action {
  ADDED,
  REMOVED,
  UNCHANGED,
};

// "+ ", "- " or "  "
const char* ActionPrefix(Action action);

// An answer record compared by owner, class, type and data, the TTL is not
// part of the comparison. Owner and embedded names compare case-insensitively.
class RecordKey {
 public:
  explicit RecordKey(const dns::ResourceRecord& record);

  // the record as received, for display
  const dns::ResourceRecord& record() const { return record_; }

  friend bool operator<(const RecordKey& a, const RecordKey& b);
  friend bool operator==(const RecordKey& a, const RecordKey& b) {
    return !(a < b) && !(b < a);
  }

 private:
  dns::ResourceRecord record_;
  std::vector<uint8_t> canonical_rdata_;
};

struct DiffItem {
  Action action;
  RecordKey key;
};

// "{prefix}{owner} {class} {type} {data}"
std::ostream& operator<<(std::ostream& os, const DiffItem& item);

// Compares the answer sections of two messages. Records that do not parse
// are left out, a message that does not parse at all has an empty answer.
// Items are sorted by record; there is no result when both sides hold the
// same records.
std::optional<std::vector<DiffItem>> DiffAnswers(
    const std::vector<uint8_t>& left, const std::vector<uint8_t>& right);

}  // namespace dnsprobe
#endif  // DNSPROBE_DIFF_H_
