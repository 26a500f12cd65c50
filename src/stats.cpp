#include "stats.hpp"

#include "logging.hpp"

namespace dnsprobe {

const char* ProtocolName(Protocol protocol) {
  switch (protocol) {
    case Protocol::UDP:
      return "UDP";
    case Protocol::TCP:
      return "TCP";
    case Protocol::TLS:
      return "TLS";
  }
  return "?";
}

Stats::Stats(const boost::asio::ip::address& server_address,
             uint16_t server_port, Protocol protocol)
    : start_(std::chrono::system_clock::now()),
      steady_start_(std::chrono::steady_clock::now()),
      server_address_(server_address),
      server_port_(server_port),
      protocol_(protocol) {}

void Stats::Finalize() {
  if (finalized_) {
    LOG_ERROR("stats of " << server_address_ << " already finalized");
    return;
  }
  duration_ = std::chrono::steady_clock::now() - steady_start_;
  finalized_ = true;
}

}  // namespace dnsprobe
