#include "resolv_conf.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include "logging.hpp"

using boost::asio::ip::make_address;
using boost::system::error_code;
using std::string;

namespace dnsprobe {

namespace {

// resolv.conf(5) limits
constexpr uint32_t kMinTimeoutSeconds = 1;
constexpr uint32_t kMaxTimeoutSeconds = 30;
constexpr uint32_t kMaxAttempts = 5;

bool ParseOptionValue(const string& option, const string& prefix,
                      uint32_t limit, uint32_t& value) {
  if (option.compare(0, prefix.size(), prefix) != 0) {
    return false;
  }
  try {
    auto parsed = std::stoul(option.substr(prefix.size()));
    value = static_cast<uint32_t>(std::min<unsigned long>(parsed, limit));
    return true;
  } catch (const std::logic_error& e) {
    LOG_DEBUG(<< "ignore option " << option << ": " << e.what());
    return false;
  }
}

}  // namespace

ResolvConf ResolvConf::Load(const string& path) {
  std::ifstream input(path);
  if (!input) {
    LOG_DEBUG(<< path << " not readable, using defaults");
    return ResolvConf();
  }
  return Parse(input);
}

ResolvConf ResolvConf::Parse(std::istream& input) {
  ResolvConf conf;
  string line;
  while (std::getline(input, line)) {
    auto comment = line.find_first_of("#;");
    if (comment != string::npos) {
      line.resize(comment);
    }
    std::istringstream words(line);
    string keyword;
    if (!(words >> keyword)) {
      continue;
    }
    if (keyword == "nameserver") {
      string value;
      if (!(words >> value)) {
        continue;
      }
      // link local scope, "fe80::1%eth0"
      auto scope = value.find('%');
      if (scope != string::npos) {
        value.resize(scope);
      }
      error_code error;
      auto nameserver = make_address(value, error);
      if (error) {
        LOG_DEBUG(<< "ignore nameserver " << value << ": "
                  << error.message());
        continue;
      }
      conf.nameservers.push_back(nameserver);
    } else if (keyword == "options") {
      string option;
      while (words >> option) {
        uint32_t value = 0;
        if (option == "use-vc") {
          conf.options.use_vc = true;
        } else if (ParseOptionValue(option, "timeout:", kMaxTimeoutSeconds,
                                    value)) {
          conf.options.timeout =
              std::chrono::seconds(std::max(value, kMinTimeoutSeconds));
        } else if (ParseOptionValue(option, "attempts:", kMaxAttempts,
                                    value)) {
          conf.options.attempts = static_cast<uint16_t>(value);
        }
      }
    }
  }
  return conf;
}

std::vector<Server> ResolvConf::ToServers() const {
  ServerSettings settings;
  settings.timeout = options.timeout;
  settings.retries = options.attempts;
  settings.udp_payload_size = options.udp_payload_size;
  auto transport = options.use_vc ? Transport::TCP : Transport::UDP_TCP;

  std::vector<Server> servers;
  for (auto& nameserver : nameservers) {
    servers.push_back(Server::Create(nameserver, kDnsPort, transport, settings));
  }
  if (servers.empty()) {
    servers.push_back(Server::Create(make_address("127.0.0.1"), kDnsPort,
                                     transport, settings));
  }
  return servers;
}

}  // namespace dnsprobe
