#ifndef DNSPROBE_STATS_H_
#define DNSPROBE_STATS_H_
#include <boost/asio/ip/address.hpp>
#include <chrono>

namespace dnsprobe {

// the protocol an answer actually travelled over
enum class Protocol { UDP, TCP, TLS };

const char* ProtocolName(Protocol protocol);

class Stats {
 public:
  Stats(const boost::asio::ip::address& server_address, uint16_t server_port,
        Protocol protocol);

  // records the elapsed time, once
  void Finalize();

  std::chrono::system_clock::time_point start() const { return start_; }
  std::chrono::steady_clock::duration duration() const { return duration_; }
  bool finalized() const { return finalized_; }
  const boost::asio::ip::address& server_address() const {
    return server_address_;
  }
  uint16_t server_port() const { return server_port_; }
  Protocol protocol() const { return protocol_; }

 private:
  std::chrono::system_clock::time_point start_;
  std::chrono::steady_clock::time_point steady_start_;
  std::chrono::steady_clock::duration duration_{};
  bool finalized_ = false;
  boost::asio::ip::address server_address_;
  uint16_t server_port_;
  Protocol protocol_;
};

}  // namespace dnsprobe
#endif  // DNSPROBE_STATS_H_
