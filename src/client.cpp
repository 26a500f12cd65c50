#include "client.hpp"

#include <openssl/x509_vfy.h>
#include "engine.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "udp_exchange.hpp"

namespace ssl = boost::asio::ssl;
using boost::system::error_code;
using std::shared_ptr;
using std::vector;

namespace dnsprobe {

namespace {

template <typename Result>
using AttemptHandler = std::function<void(error_code, Result)>;

template <typename Result>
using Attempt =
    std::function<void(const Server& server, AttemptHandler<Result> handler)>;

// tries servers[index], then the ones after it while attempts fail
template <typename Result>
void TryServer(shared_ptr<const vector<Server>> servers, size_t index,
               Attempt<Result> attempt, AttemptHandler<Result> handler) {
  auto& server = (*servers)[index];
  LOG_TRACE(<< "attempt " << index << " " << server);
  attempt(server, [servers, index, attempt, handler](error_code error,
                                                     Result result) {
    if (!error || IsConfigurationError(error)) {
      handler(error, std::move(result));
      return;
    }
    auto& failed = (*servers)[index];
    if (index + 1 < servers->size()) {
      LOG_DEBUG(<< failed << " failed: " << error.message() << ", trying "
                << (*servers)[index + 1]);
      TryServer<Result>(servers, index + 1, attempt, handler);
      return;
    }
    LOG_INFO(<< failed << " failed: " << error.message()
             << ", no more servers");
    handler(error, Result());
  });
}

// the name OpenSSL will check the certificate against, also sent as SNI
bool IsValidTlsHostname(const std::string& hostname) {
  // rfc6066 3 limits the server name to 2^8 - 1 bytes
  if (hostname.empty() || hostname.size() > 255) {
    return false;
  }
  auto param = X509_VERIFY_PARAM_new();
  if (!param) {
    return false;
  }
  auto valid = X509_VERIFY_PARAM_set1_host(param, hostname.data(),
                                           hostname.size()) == 1;
  X509_VERIFY_PARAM_free(param);
  return valid;
}

template <typename Handler>
void PostError(Handler handler, error_code error) {
  boost::asio::post(Engine::get().GetExecutor(),
                    [handler, error]() { handler(error, {}); });
}

template <typename ConnectionType>
void OpenConnection(typename ConnectionType::pointer connection,
                    vector<uint8_t> buffer, const RequestMessage& request,
                    uint16_t id, const Stats& stats,
                    Client::StreamHandler handler) {
  connection->Open(std::move(buffer), [connection, request, id, stats,
                                       handler](error_code error) {
    if (error) {
      handler(error, nullptr);
      return;
    }
    handler(error, ResponseStream::create(connection, request, id, stats));
  });
}

}  // namespace

Client::Client(vector<Server> servers) : servers_(std::move(servers)) {
  for (auto& server : servers_) {
    if (server.transport != Transport::TLS) {
      continue;
    }
    ssl_context_ = std::make_shared<ssl::context>(ssl::context::tls_client);
    // Use system cert
    error_code error;
    ssl_context_->set_default_verify_paths(error);
    if (error) {
      LOG_ERROR(<< "set_default_verify_paths: " << error.message());
    }
    // minor tls version set to 1.2
    ssl_context_->set_options(ssl::context::default_workarounds |
                              ssl::context::no_tlsv1 |
                              ssl::context::no_tlsv1_1);
    break;
  }
}

error_code Client::CheckServers(const RequestMessage& request,
                                bool multi) const {
  if (servers_.empty()) {
    return Error::no_servers;
  }
  for (auto& server : servers_) {
    if (server.transport == Transport::TLS) {
      if (!server.tls_hostname || server.tls_hostname->empty()) {
        return Error::missing_tls_hostname;
      }
      if (!IsValidTlsHostname(*server.tls_hostname)) {
        return Error::invalid_tls_hostname;
      }
    }
    if (multi && (server.transport == Transport::UDP ||
                  server.transport == Transport::UDP_TCP)) {
      return Error::multi_over_datagram;
    }
    vector<uint8_t> buffer;
    if (request.Encode(0, server.udp_payload_size,
                       RequestMessage::Framing::STREAM,
                       buffer) != dns::MessageEncoder::ResultType::good) {
      return Error::invalid_request;
    }
  }
  return error_code();
}

void Client::AsyncRequest(const RequestMessage& request,
                          AnswerHandler handler) {
  auto error = CheckServers(request, false);
  if (error) {
    LOG_ERROR(<< request.question().name << " " << error.message());
    PostError(std::move(handler), error);
    return;
  }
  auto servers = std::make_shared<const vector<Server>>(servers_);
  auto ssl_context = ssl_context_;
  TryServer<std::optional<Answer>>(
      servers, 0,
      [request, ssl_context](const Server& server,
                             AttemptHandler<std::optional<Answer>> handler) {
        RequestServer(server, request, ssl_context, std::move(handler));
      },
      std::move(handler));
}

void Client::AsyncRequestMulti(const RequestMessage& request,
                               StreamHandler handler) {
  auto error = CheckServers(request, true);
  if (error) {
    LOG_ERROR(<< request.question().name << " " << error.message());
    PostError(std::move(handler), error);
    return;
  }
  auto servers = std::make_shared<const vector<Server>>(servers_);
  auto ssl_context = ssl_context_;
  TryServer<ResponseStream::pointer>(
      servers, 0,
      [request, ssl_context](const Server& server,
                             AttemptHandler<ResponseStream::pointer> handler) {
        OpenStream(server, request, ssl_context, std::move(handler));
      },
      std::move(handler));
}

void Client::RequestServer(const Server& server, const RequestMessage& request,
                           const shared_ptr<ssl::context>& ssl_context,
                           AnswerHandler handler) {
  switch (server.transport) {
    case Transport::UDP:
      UdpExchange::create(server, request)->Start(std::move(handler));
      return;
    case Transport::UDP_TCP:
      UdpExchange::create(server, request)
          ->Start([server, request, handler](error_code error,
                                             std::optional<Answer> answer) {
            if (error || !answer->is_truncated()) {
              handler(error, std::move(answer));
              return;
            }
            LOG_DEBUG(<< server << " truncated, retry over TCP");
            auto tcp_server = server;
            tcp_server.transport = Transport::TCP;
            RequestOverStream(tcp_server, request, nullptr, handler);
          });
      return;
    case Transport::TCP:
    case Transport::TLS:
      RequestOverStream(server, request, ssl_context, std::move(handler));
      return;
  }
}

void Client::RequestOverStream(const Server& server,
                               const RequestMessage& request,
                               const shared_ptr<ssl::context>& ssl_context,
                               AnswerHandler handler) {
  OpenStream(server, request, ssl_context,
             [handler](error_code error, ResponseStream::pointer stream) {
               if (error) {
                 handler(error, std::nullopt);
                 return;
               }
               stream->AsyncNext([stream, handler](
                                     error_code error,
                                     std::optional<Answer> answer) {
                 if (!error && !answer) {
                   error = boost::asio::error::eof;
                 }
                 handler(error, std::move(answer));
               });
             });
}

void Client::OpenStream(const Server& server, const RequestMessage& request,
                        const shared_ptr<ssl::context>& ssl_context,
                        StreamHandler handler) {
  auto id = RequestMessage::RandomId();
  vector<uint8_t> buffer;
  if (request.Encode(id, server.udp_payload_size,
                     RequestMessage::Framing::STREAM,
                     buffer) != dns::MessageEncoder::ResultType::good) {
    LOG_ERROR(<< request.question().name << " encode failed");
    PostError(std::move(handler), make_error_code(Error::invalid_request));
    return;
  }
  if (server.transport == Transport::TLS) {
    Stats stats(server.address, server.port, Protocol::TLS);
    OpenConnection<TlsConnection>(
        TlsConnection::create(server, ssl_context), std::move(buffer),
        request, id, stats, std::move(handler));
    return;
  }
  Stats stats(server.address, server.port, Protocol::TCP);
  OpenConnection<TcpConnection>(TcpConnection::create(server),
                                std::move(buffer), request, id, stats,
                                std::move(handler));
}

}  // namespace dnsprobe
