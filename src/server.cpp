#include "server.hpp"

namespace dnsprobe {

const char* TransportName(Transport transport) {
  switch (transport) {
    case Transport::UDP:
      return "UDP";
    case Transport::UDP_TCP:
      return "UDP+TCP";
    case Transport::TCP:
      return "TCP";
    case Transport::TLS:
      return "TLS";
  }
  return "?";
}

Server Server::Create(const boost::asio::ip::address& address, uint16_t port,
                      Transport transport, const ServerSettings& settings,
                      std::optional<std::string> tls_hostname) {
  Server server;
  server.address = address;
  server.port = port;
  server.transport = transport;
  server.timeout = settings.timeout;
  server.retries = settings.retries;
  server.udp_payload_size = settings.udp_payload_size;
  server.tls_hostname = std::move(tls_hostname);
  return server;
}

std::ostream& operator<<(std::ostream& os, const Server& server) {
  os << server.address << "#" << server.port << " "
     << TransportName(server.transport);
  if (server.tls_hostname) {
    os << " " << *server.tls_hostname;
  }
  return os;
}

}  // namespace dnsprobe
