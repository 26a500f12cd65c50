#ifndef DNSPROBE_CLIENT_H_
#define DNSPROBE_CLIENT_H_
#include <boost/asio/ssl.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <vector>
#include "answer.hpp"
#include "request.hpp"
#include "response_stream.hpp"
#include "server.hpp"

namespace dnsprobe {

// Sends a request to an ordered list of servers. Each server is tried once,
// with its own transport fallback, and the next server is only tried after
// the current one failed. The error of the last server is reported when all
// of them fail.
class Client {
 public:
  using AnswerHandler =
      std::function<void(boost::system::error_code, std::optional<Answer>)>;
  using StreamHandler =
      std::function<void(boost::system::error_code, ResponseStream::pointer)>;

  explicit Client(std::vector<Server> servers);

  void AsyncRequest(const RequestMessage& request, AnswerHandler handler);
  // only TCP and TLS servers can carry a multi message response
  void AsyncRequestMulti(const RequestMessage& request, StreamHandler handler);

  const std::vector<Server>& servers() const { return servers_; }

 private:
  std::vector<Server> servers_;
  // shared by the TLS connections of every request, null without TLS servers
  std::shared_ptr<boost::asio::ssl::context> ssl_context_;

  boost::system::error_code CheckServers(const RequestMessage& request,
                                         bool multi) const;

  static void RequestServer(
      const Server& server, const RequestMessage& request,
      const std::shared_ptr<boost::asio::ssl::context>& ssl_context,
      AnswerHandler handler);
  static void RequestOverStream(
      const Server& server, const RequestMessage& request,
      const std::shared_ptr<boost::asio::ssl::context>& ssl_context,
      AnswerHandler handler);
  static void OpenStream(
      const Server& server, const RequestMessage& request,
      const std::shared_ptr<boost::asio::ssl::context>& ssl_context,
      StreamHandler handler);
};

}  // namespace dnsprobe
#endif  // DNSPROBE_CLIENT_H_
