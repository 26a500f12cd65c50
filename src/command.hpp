#ifndef DNSPROBE_COMMAND_H_
#define DNSPROBE_COMMAND_H_
#include "configuration.hpp"

namespace dnsprobe {

// Both return the process exit status.
int RunQuery(const Configuration& configuration);
int RunXfr(const Configuration& configuration);
// forward or reverse lookup of every host name or address argument
int RunLookup(const Configuration& configuration);

}  // namespace dnsprobe
#endif  // DNSPROBE_COMMAND_H_
