#ifndef DNSPROBE_SERVER_H_
#define DNSPROBE_SERVER_H_
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ip/udp.hpp>
#include <chrono>
#include <iostream>
#include <optional>
#include <string>

namespace dnsprobe {

constexpr uint16_t kDnsPort = 53;
constexpr uint16_t kDnsOverTlsPort = 853;

enum class Transport {
  UDP,
  // UDP first, TCP when the response is truncated
  UDP_TCP,
  TCP,
  TLS,
};

const char* TransportName(Transport transport);

// per server knobs that do not depend on where the server came from
struct ServerSettings {
  std::chrono::milliseconds timeout = std::chrono::seconds(5);
  uint16_t retries = 2;
  uint16_t udp_payload_size = 1232;
};

struct Server {
  boost::asio::ip::address address;
  uint16_t port = kDnsPort;
  Transport transport = Transport::UDP_TCP;
  // read timeout of a single attempt
  std::chrono::milliseconds timeout = std::chrono::seconds(5);
  // UDP retransmissions after the first datagram
  uint16_t retries = 2;
  uint16_t udp_payload_size = 1232;
  // SNI and certificate name, required for TLS
  std::optional<std::string> tls_hostname;

  static Server Create(const boost::asio::ip::address& address, uint16_t port,
                       Transport transport, const ServerSettings& settings,
                       std::optional<std::string> tls_hostname = std::nullopt);

  boost::asio::ip::udp::endpoint udp_endpoint() const {
    return boost::asio::ip::udp::endpoint(address, port);
  }
  boost::asio::ip::tcp::endpoint tcp_endpoint() const {
    return boost::asio::ip::tcp::endpoint(address, port);
  }

  friend std::ostream& operator<<(std::ostream& os, const Server& server);
};

}  // namespace dnsprobe
#endif  // DNSPROBE_SERVER_H_
