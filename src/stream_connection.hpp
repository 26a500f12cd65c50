#ifndef DNSPROBE_STREAM_CONNECTION_H_
#define DNSPROBE_STREAM_CONNECTION_H_
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>
#include "engine.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "message_reader.hpp"
#include "server.hpp"

namespace dnsprobe {

using TlsStream = boost::asio::ssl::stream<boost::asio::ip::tcp::socket>;

// A TCP or TLS connection carrying one request. Once the request is written
// the connection keeps reading on its own (the pump), received messages wait
// in the inbox until they are pulled with AsyncNext.
template <typename StreamType>
class StreamConnection
    : public std::enable_shared_from_this<StreamConnection<StreamType>> {
 public:
  using pointer = std::shared_ptr<StreamConnection<StreamType>>;
  using OpenHandler = std::function<void(boost::system::error_code)>;
  using MessageHandler = std::function<void(
      boost::system::error_code, std::optional<std::vector<uint8_t>>)>;

  static constexpr bool kIsTls = std::is_same<StreamType, TlsStream>::value;

  // ssl_context is only used by TLS connections
  static pointer create(
      const Server& server,
      std::shared_ptr<boost::asio::ssl::context> ssl_context = nullptr) {
    return pointer(new StreamConnection(server, std::move(ssl_context)));
  }

  ~StreamConnection() { CloseConnection(); }

  // connects (and handshakes) then writes the length prefixed request
  void Open(std::vector<uint8_t> request, OpenHandler handler) {
    open_handler_ = std::move(handler);
    request_ = std::move(request);
    if constexpr (kIsTls) {
      if (!server_.tls_hostname || server_.tls_hostname->empty()) {
        PostFailure(Error::missing_tls_hostname);
        return;
      }
      auto& hostname = *server_.tls_hostname;
      stream_->set_verify_mode(boost::asio::ssl::verify_peer);
      // Enable automatic hostname checks
      auto param = SSL_get0_param(stream_->native_handle());
      X509_VERIFY_PARAM_set_hostflags(param,
                                      X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS);
      if (!X509_VERIFY_PARAM_set1_host(param, hostname.data(),
                                       hostname.length()) ||
          !SSL_set_tlsext_host_name(stream_->native_handle(),
                                    hostname.c_str())) {
        PostFailure(Error::invalid_tls_hostname);
        return;
      }
      stream_->set_verify_callback(
          [hostname](bool preverified,
                     boost::asio::ssl::verify_context& context) {
            char subject_name[256];
            X509* cert =
                X509_STORE_CTX_get_current_cert(context.native_handle());
            X509_NAME_oneline(X509_get_subject_name(cert), subject_name, 256);
            LOG_DEBUG(" verifying " << hostname << " :" << subject_name);
            return preverified;
          });
    }
    io_status_ = IOStatus::CONNECTING;
    UpdateSocketTimeout();
    LOG_TRACE(<< server_ << " connecting");
    stream_->lowest_layer().async_connect(
        server_.tcp_endpoint(),
        [self = this->shared_from_this()](
            const boost::system::error_code& error) {
          if (self->io_status_ == IOStatus::CLOSED) {
            return;
          }
          if (error) {
            LOG_DEBUG(<< self->server_ << " connect failed: "
                      << error.message());
            self->Fail(error);
            return;
          }
          if constexpr (kIsTls) {
            self->Handshake();
          } else {
            self->DoWrite();
          }
        });
  }

  // the next message of the connection, a failed or closed connection
  // reports its error once the inbox is drained
  void AsyncNext(MessageHandler handler) {
    if (waiting_handler_) {
      LOG_ERROR(<< server_ << " already waiting for a message");
      boost::asio::post(Engine::get().GetExecutor(), [handler]() {
        handler(boost::asio::error::already_started, std::nullopt);
      });
      return;
    }
    waiting_handler_ = std::move(handler);
    if (inbox_.empty() && !error_) {
      UpdateSocketTimeout();
    }
    Deliver();
  }

  void Close() {
    if (!error_) {
      error_ = boost::asio::error::operation_aborted;
    }
    CloseConnection();
    Deliver();
  }

 private:
  StreamConnection(const Server& server,
                   std::shared_ptr<boost::asio::ssl::context> ssl_context)
      : server_(server),
        ssl_context_(std::move(ssl_context)),
        timeout_timer_(Engine::get().GetExecutor()) {
    if constexpr (kIsTls) {
      stream_ = std::make_shared<StreamType>(Engine::get().GetExecutor(),
                                             *ssl_context_);
    } else {
      stream_ = std::make_shared<StreamType>(Engine::get().GetExecutor());
    }
  }

  enum class IOStatus {
    NOT_INITIALIZED,
    CONNECTING,
    HANDSHAKING,
    WRITING,
    READY,
    CLOSED,
  } io_status_ = IOStatus::NOT_INITIALIZED;

  Server server_;
  std::shared_ptr<boost::asio::ssl::context> ssl_context_;
  // NOTE:
  // A stream object must not be destroyed while there are pending
  // asynchronous operations associated with it, handlers keep the connection
  // alive.
  std::shared_ptr<StreamType> stream_;
  boost::asio::steady_timer timeout_timer_;
  std::vector<uint8_t> request_;
  MessageReader message_reader_;
  OpenHandler open_handler_;
  MessageHandler waiting_handler_;
  std::deque<std::vector<uint8_t>> inbox_;
  boost::system::error_code error_;

  void UpdateSocketTimeout() {
    timeout_timer_.expires_after(server_.timeout);
    timeout_timer_.async_wait([self = this->shared_from_this()](
                                  boost::system::error_code error) {
      if (error || self->io_status_ == IOStatus::CLOSED) {
        return;
      }
      if (self->io_status_ == IOStatus::READY &&
          (!self->waiting_handler_ || !self->inbox_.empty())) {
        return;
      }
      LOG_DEBUG(<< self->server_ << " socket timed out");
      self->Fail(boost::asio::error::timed_out);
    });
  }

  void Handshake() {
    io_status_ = IOStatus::HANDSHAKING;
    if constexpr (kIsTls) {
      stream_->async_handshake(
          boost::asio::ssl::stream_base::client,
          [self = this->shared_from_this()](
              const boost::system::error_code& error) {
            if (self->io_status_ == IOStatus::CLOSED) {
              return;
            }
            if (error) {
              LOG_DEBUG(<< self->server_
                        << " handshake failed: " << error.message());
              self->Fail(error);
              return;
            }
            LOG_TRACE(<< self->server_ << " handshake success");
            self->DoWrite();
          });
    }
  }

  void DoWrite() {
    io_status_ = IOStatus::WRITING;
    boost::asio::async_write(
        *stream_, boost::asio::buffer(request_),
        [self = this->shared_from_this()](
            const boost::system::error_code& error,
            std::size_t /*bytes_transfered*/) {
          if (self->io_status_ == IOStatus::CLOSED) {
            return;
          }
          if (error) {
            LOG_DEBUG(<< self->server_ << " write failed " << error.message());
            self->Fail(error);
            return;
          }
          self->io_status_ = IOStatus::READY;
          self->timeout_timer_.cancel();
          self->message_reader_.Start(
              *self->stream_,
              [self](MessageReader::Reason reason, const uint8_t* data,
                     size_t data_size) {
                self->HandleServerMessage(reason, data, data_size);
              });
          auto handler = std::move(self->open_handler_);
          self->open_handler_ = nullptr;
          handler(boost::system::error_code());
        });
  }

  void HandleServerMessage(MessageReader::Reason reason, const uint8_t* data,
                           size_t data_size) {
    switch (reason) {
      case MessageReader::Reason::NEW_MESSAGE:
        LOG_TRACE(<< server_ << " message of " << data_size << " bytes");
        inbox_.emplace_back(data, data + data_size);
        break;
      case MessageReader::Reason::IO_ERROR:
        if (!error_) {
          error_ = message_reader_.error();
        }
        CloseConnection();
        break;
      case MessageReader::Reason::MANUAL_STOPPED:
        if (!error_) {
          error_ = boost::asio::error::operation_aborted;
        }
        break;
    }
    Deliver();
  }

  void Deliver() {
    if (!waiting_handler_) {
      return;
    }
    if (!inbox_.empty()) {
      auto message = std::move(inbox_.front());
      inbox_.pop_front();
      PostToWaitingHandler(boost::system::error_code(), std::move(message));
    } else if (error_) {
      PostToWaitingHandler(error_, std::nullopt);
    }
  }

  void PostToWaitingHandler(boost::system::error_code error,
                            std::optional<std::vector<uint8_t>> message) {
    auto handler = std::move(waiting_handler_);
    waiting_handler_ = nullptr;
    boost::asio::post(
        Engine::get().GetExecutor(),
        [handler = std::move(handler), error,
         message = std::move(message)]() mutable {
          handler(error, std::move(message));
        });
  }

  void Fail(const boost::system::error_code& error) {
    if (!error_) {
      error_ = error;
    }
    CloseConnection();
    if (open_handler_) {
      auto handler = std::move(open_handler_);
      open_handler_ = nullptr;
      handler(error_);
    }
    Deliver();
  }

  void PostFailure(const boost::system::error_code& error) {
    boost::asio::post(Engine::get().GetExecutor(),
                      [self = this->shared_from_this(), error]() {
                        self->Fail(error);
                      });
  }

  void CloseConnection() {
    if (io_status_ == IOStatus::CLOSED) {
      return;
    }
    LOG_TRACE(<< server_);
    io_status_ = IOStatus::CLOSED;
    message_reader_.Stop();
    timeout_timer_.cancel();
    boost::system::error_code error;
    stream_->lowest_layer().close(error);
    if (error) {
      LOG_DEBUG(<< server_ << " close: " << error.message());
    }
  }
};

using TcpConnection = StreamConnection<boost::asio::ip::tcp::socket>;
using TlsConnection = StreamConnection<TlsStream>;

}  // namespace dnsprobe
#endif  // DNSPROBE_STREAM_CONNECTION_H_
