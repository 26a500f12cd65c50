#include "output.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>

using std::endl;

namespace dnsprobe {

namespace {

void PrintSection(std::ostream& os, const char* title,
                  const std::vector<dns::ResourceRecord>& records) {
  if (records.empty()) {
    return;
  }
  os << "\n;; " << title << " SECTION:" << endl;
  for (auto& record : records) {
    PrintRecord(os, record);
  }
}

}  // namespace

void PrintRecord(std::ostream& os, const dns::ResourceRecord& record) {
  os << record.name << "  " << record.ttl << "  "
     << dns::ClassToString(record.the_class) << "  "
     << dns::TypeToString(record.type) << "  "
     << dns::rdata::ToString(record.type, record.rdata) << endl;
}

void PrintAnswer(std::ostream& os, const Answer& answer) {
  dns::Message message;
  if (answer.Decode(message) != dns::MessageDecoder::ResultType::good) {
    os << ";; malformed message of " << answer.raw_message().size()
       << " bytes" << endl;
    return;
  }

  auto& header = message.header;
  os << ";; ->>HEADER<<- opcode: "
     << dns::OpcodeToString(header.operation_code)
     << ", rcode: " << dns::RcodeToString(header.response_code)
     << ", id: " << header.id << endl;
  os << ";; flags: " << dns::FlagsToString(header)
     << "; QUERY: " << message.questions.size()
     << ", ANSWER: " << message.answers.size()
     << ", AUTHORITY: " << message.authorities.size()
     << ", ADDITIONAL: " << message.additional.size() << endl;

  auto edns = message.edns();
  if (edns) {
    os << "\n;; OPT PSEUDOSECTION:" << endl;
    os << "; EDNS: version " << static_cast<unsigned>(edns->version)
       << "; flags: " << (edns->dnssec_ok ? "do" : "")
       << "; udp: " << edns->udp_payload_size << endl;
  }

  if (!message.questions.empty()) {
    os << "\n;; QUESTION SECTION:" << endl;
    for (auto& question : message.questions) {
      os << ";" << question.name << "  "
         << dns::ClassToString(question.the_class) << "  "
         << dns::TypeToString(question.type) << endl;
    }
  }

  PrintSection(os, "ANSWER", message.answers);
  PrintSection(os, "AUTHORITY", message.authorities);
  std::vector<dns::ResourceRecord> additional;
  for (auto& record : message.additional) {
    if (record.type != dns::ToInt(dns::TYPE::OPT)) {
      additional.push_back(record);
    }
  }
  PrintSection(os, "ADDITIONAL", additional);

  auto& stats = answer.stats();
  auto start = std::chrono::system_clock::to_time_t(stats.start());
  std::tm local_start{};
  localtime_r(&start, &local_start);
  os << "\n;; Query time: "
     << std::chrono::duration_cast<std::chrono::milliseconds>(
            stats.duration())
            .count()
     << " msec" << endl;
  os << ";; SERVER: " << stats.server_address() << "#" << stats.server_port()
     << " (" << ProtocolName(stats.protocol()) << ")" << endl;
  os << ";; WHEN: " << std::put_time(&local_start, "%a %b %d %H:%M:%S %Z %Y")
     << endl;
  os << ";; MSG SIZE  rcvd: " << answer.raw_message().size() << endl;
}

void PrintVerification(std::ostream& os, const Verification& verification) {
  if (verification.error) {
    os << "\n;; Verification failed: " << verification.error.message()
       << endl;
    return;
  }
  if (!verification.diff) {
    os << "\n;; Authoritative ANSWER matches." << endl;
    return;
  }
  os << "\n;; Authoritative ANSWER does not match." << endl;
  os << ";; Difference of ANSWER with authoritative server ";
  if (verification.authoritative_answer) {
    auto& stats = verification.authoritative_answer->stats();
    os << stats.server_address() << "#" << stats.server_port();
  }
  os << ":" << endl;
  for (auto& item : *verification.diff) {
    os << item << endl;
  }
}

void PrintHostLookup(std::ostream& os, const HostLookupResult& result) {
  os << result.name;
  if (!result.canonical_name.empty() &&
      !dns::NameEquals(result.canonical_name, result.name)) {
    os << " (alias for " << result.canonical_name << ")";
  }
  os << endl;
  if (result.canonical_name.empty()) {
    if (result.host_names.empty()) {
      os << "  <no hosts found>" << endl;
    }
    for (auto& host_name : result.host_names) {
      os << "  " << host_name << endl;
    }
    return;
  }
  if (result.addresses.empty()) {
    os << "  <no addresses found>" << endl;
  }
  for (auto& found : result.addresses) {
    os << "  " << found << endl;
  }
}

}  // namespace dnsprobe
