#include "diff.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include "logging.hpp"

using std::set;
using std::vector;

namespace dnsprobe {

namespace {

set<RecordKey> AnswerRecords(const vector<uint8_t>& raw_message) {
  set<RecordKey> records;
  dns::Message message;
  if (dns::MessageDecoder::DecodeMessageLeniently(
          message, raw_message.data(), raw_message.size()) !=
      dns::MessageDecoder::ResultType::good) {
    LOG_DEBUG(<< "unparseable message of " << raw_message.size()
              << " bytes");
    return records;
  }
  for (auto& record : message.answers) {
    records.emplace(record);
  }
  return records;
}

}  // namespace

const char* ActionPrefix(Action action) {
  switch (action) {
    case Action::ADDED:
      return "+ ";
    case Action::REMOVED:
      return "- ";
    case Action::UNCHANGED:
      return "  ";
  }
  return "? ";
}

RecordKey::RecordKey(const dns::ResourceRecord& record)
    : record_(record),
      canonical_rdata_(dns::rdata::ToCanonical(record.type, record.rdata)) {}

bool operator<(const RecordKey& a, const RecordKey& b) {
  auto order = dns::CompareNames(a.record_.name, b.record_.name);
  if (order != 0) {
    return order < 0;
  }
  if (a.record_.the_class != b.record_.the_class) {
    return a.record_.the_class < b.record_.the_class;
  }
  if (a.record_.type != b.record_.type) {
    return a.record_.type < b.record_.type;
  }
  return a.canonical_rdata_ < b.canonical_rdata_;
}

std::ostream& operator<<(std::ostream& os, const DiffItem& item) {
  auto& record = item.key.record();
  os << ActionPrefix(item.action) << record.name << " "
     << dns::ClassToString(record.the_class) << " "
     << dns::TypeToString(record.type) << " "
     << dns::rdata::ToString(record.type, record.rdata);
  return os;
}

std::optional<vector<DiffItem>> DiffAnswers(const vector<uint8_t>& left,
                                            const vector<uint8_t>& right) {
  auto left_records = AnswerRecords(left);
  auto right_records = AnswerRecords(right);

  vector<RecordKey> unchanged;
  vector<RecordKey> removed;
  vector<RecordKey> added;
  std::set_intersection(left_records.begin(), left_records.end(),
                        right_records.begin(), right_records.end(),
                        std::back_inserter(unchanged));
  std::set_difference(left_records.begin(), left_records.end(),
                      right_records.begin(), right_records.end(),
                      std::back_inserter(removed));
  std::set_difference(right_records.begin(), right_records.end(),
                      left_records.begin(), left_records.end(),
                      std::back_inserter(added));
  if (removed.empty() && added.empty()) {
    return std::nullopt;
  }

  vector<DiffItem> diff;
  for (auto& key : unchanged) {
    diff.push_back({Action::UNCHANGED, key});
  }
  for (auto& key : removed) {
    diff.push_back({Action::REMOVED, key});
  }
  for (auto& key : added) {
    diff.push_back({Action::ADDED, key});
  }
  std::stable_sort(diff.begin(), diff.end(),
                   [](const DiffItem& a, const DiffItem& b) {
                     return a.key < b.key;
                   });
  return diff;
}

}  // namespace dnsprobe
