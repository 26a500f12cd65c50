#ifndef DNSPROBE_RESOLV_CONF_H_
#define DNSPROBE_RESOLV_CONF_H_
#include <boost/asio/ip/address.hpp>
#include <chrono>
#include <istream>
#include <string>
#include <vector>
#include "server.hpp"

namespace dnsprobe {

// The system resolver configuration, read once and passed around by value.
struct ResolvConf {
  struct Options {
    std::chrono::milliseconds timeout = std::chrono::seconds(5);
    uint16_t attempts = 2;
    // "use-vc", TCP only
    bool use_vc = false;
    uint16_t udp_payload_size = 1232;
  };

  std::vector<boost::asio::ip::address> nameservers;
  Options options;

  // a missing file yields the defaults
  static ResolvConf Load(const std::string& path = "/etc/resolv.conf");
  static ResolvConf Parse(std::istream& input);

  // 127.0.0.1 when no nameserver is listed
  std::vector<Server> ToServers() const;
};

}  // namespace dnsprobe
#endif  // DNSPROBE_RESOLV_CONF_H_
