#ifndef DNSPROBE_OUTPUT_H_
#define DNSPROBE_OUTPUT_H_
#include <ostream>
#include "answer.hpp"
#include "host_lookup.hpp"
#include "query.hpp"

namespace dnsprobe {

// dig compatible rendering of a received message and its stats
void PrintAnswer(std::ostream& os, const Answer& answer);
void PrintRecord(std::ostream& os, const dns::ResourceRecord& record);
// the verification result that follows the answer of a verified query
void PrintVerification(std::ostream& os, const Verification& verification);
// the name followed by one indented line per address or host name
void PrintHostLookup(std::ostream& os, const HostLookupResult& result);

}  // namespace dnsprobe
#endif  // DNSPROBE_OUTPUT_H_
