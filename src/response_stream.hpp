#ifndef DNSPROBE_RESPONSE_STREAM_H_
#define DNSPROBE_RESPONSE_STREAM_H_
#include <functional>
#include <memory>
#include <optional>
#include <variant>
#include "answer.hpp"
#include "request.hpp"
#include "stream_connection.hpp"
#include "xfr_tracker.hpp"

namespace dnsprobe {

// The requester's side of an open TCP or TLS connection. Messages are pulled
// one at a time, the connection is closed once the last message of the
// response (the final SOA of a zone transfer) has been handed out.
class ResponseStream : public std::enable_shared_from_this<ResponseStream> {
 public:
  using pointer = std::shared_ptr<ResponseStream>;
  using Connection = std::variant<TcpConnection::pointer,
                                  TlsConnection::pointer>;
  // no error and no answer: the response is complete
  using Handler =
      std::function<void(boost::system::error_code, std::optional<Answer>)>;

  static pointer create(Connection connection, const RequestMessage& request,
                        uint16_t id, Stats stats) {
    return pointer(
        new ResponseStream(std::move(connection), request, id, stats));
  }

  ~ResponseStream();

  void AsyncNext(Handler handler);
  void Close();

  bool is_complete() const { return complete_; }
  size_t received() const { return received_; }

 private:
  ResponseStream(Connection connection, const RequestMessage& request,
                 uint16_t id, Stats stats);

  Connection connection_;
  RequestMessage request_;
  uint16_t id_;
  Stats stats_;
  XfrTracker tracker_;
  size_t received_ = 0;
  bool complete_ = false;

  void HandleMessage(boost::system::error_code error,
                     std::optional<std::vector<uint8_t>> message,
                     const Handler& handler);
};

}  // namespace dnsprobe
#endif  // DNSPROBE_RESPONSE_STREAM_H_
