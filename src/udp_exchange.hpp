#ifndef DNSPROBE_UDP_EXCHANGE_H_
#define DNSPROBE_UDP_EXCHANGE_H_
#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <vector>
#include "answer.hpp"
#include "message_reader.hpp"
#include "request.hpp"
#include "server.hpp"

namespace dnsprobe {

// One query over a connected UDP socket. The datagram is sent again every
// time the read timeout expires, up to server.retries times, answers that do
// not match the query are ignored.
class UdpExchange : public std::enable_shared_from_this<UdpExchange> {
 public:
  using pointer = std::shared_ptr<UdpExchange>;
  using Handler =
      std::function<void(boost::system::error_code, std::optional<Answer>)>;

  static pointer create(const Server& server, const RequestMessage& request) {
    return pointer(new UdpExchange(server, request));
  }

  void Start(Handler handler);

 private:
  UdpExchange(const Server& server, const RequestMessage& request);

  // rfc1035 4.2.1, largest message a udp datagram carries
  static constexpr size_t kMaxDatagramSize = 65535;

  Server server_;
  RequestMessage request_;
  uint16_t id_;
  std::vector<uint8_t> query_;
  boost::asio::ip::udp::socket socket_;
  boost::asio::steady_timer timer_;
  MessageReader message_reader_;
  Stats stats_;
  Handler handler_;
  uint16_t sent_count_ = 0;
  bool finished_ = false;

  void Send();
  void UpdateTimeout();
  void HandleServerMessage(MessageReader::Reason reason, const uint8_t* data,
                           size_t data_size);
  void Finish(boost::system::error_code error,
              std::vector<uint8_t> message = {});
};

}  // namespace dnsprobe
#endif  // DNSPROBE_UDP_EXCHANGE_H_
