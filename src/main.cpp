#include <unistd.h>
#include "command.hpp"
#include "configuration.hpp"
#include "logging.hpp"

using boost::log::trivial::severity_level;
using dnsprobe::Configuration;
using dnsprobe::InitLogging;

int main(int argc, const char **argv) {
  InitLogging();
  Configuration configuration;
  auto result = configuration.Init(argc, argv);
  if (result != 0) {
    return result < 0 ? 1 : 0;
  }
  InitLogging(configuration.get("log-level").as<severity_level>());
  LOG_DEBUG(<< "dnsprobe pid:" << getpid());

  if (configuration.get("lookup").as<bool>()) {
    return dnsprobe::RunLookup(configuration);
  }
  if (configuration.get("xfr").as<bool>()) {
    return dnsprobe::RunXfr(configuration);
  }
  return dnsprobe::RunQuery(configuration);
}
