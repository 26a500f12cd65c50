#include "udp_exchange.hpp"

#include "engine.hpp"
#include "error.hpp"
#include "logging.hpp"

using boost::asio::ip::udp;
using boost::system::error_code;

namespace dnsprobe {

UdpExchange::UdpExchange(const Server& server, const RequestMessage& request)
    : server_(server),
      request_(request),
      id_(RequestMessage::RandomId()),
      socket_(Engine::get().GetExecutor()),
      timer_(Engine::get().GetExecutor()),
      stats_(server.address, server.port, Protocol::UDP) {}

void UdpExchange::Start(Handler handler) {
  handler_ = std::move(handler);
  auto fail_later = [self = shared_from_this()](error_code error) {
    boost::asio::post(Engine::get().GetExecutor(),
                      [self, error]() { self->Finish(error); });
  };

  if (request_.Encode(id_, server_.udp_payload_size,
                      RequestMessage::Framing::DATAGRAM, query_) !=
      dns::MessageEncoder::ResultType::good) {
    LOG_ERROR(<< request_.question().name << " encode failed");
    fail_later(Error::invalid_request);
    return;
  }

  error_code error;
  auto endpoint = server_.udp_endpoint();
  socket_.open(endpoint.protocol(), error);
  if (!error) {
    socket_.connect(endpoint, error);
  }
  if (error) {
    LOG_DEBUG(<< server_ << " " << error.message());
    fail_later(error);
    return;
  }

  message_reader_.resize_buffer(kMaxDatagramSize);
  message_reader_.Start(
      socket_, [self = shared_from_this()](MessageReader::Reason reason,
                                           const uint8_t* data,
                                           size_t data_size) {
        self->HandleServerMessage(reason, data, data_size);
      });
  Send();
}

void UdpExchange::Send() {
  sent_count_++;
  LOG_TRACE(<< server_ << " " << id_ << " send #" << sent_count_);
  socket_.async_send(
      boost::asio::buffer(query_),
      [self = shared_from_this()](error_code error, size_t /*bytes_sent*/) {
        if (self->finished_) {
          return;
        }
        if (error) {
          LOG_DEBUG(<< self->server_ << " send failed: " << error.message());
          self->Finish(error);
        }
      });
  UpdateTimeout();
}

void UdpExchange::UpdateTimeout() {
  timer_.expires_after(server_.timeout);
  timer_.async_wait([self = shared_from_this()](error_code error) {
    if (error || self->finished_) {
      return;
    }
    if (self->sent_count_ <= self->server_.retries) {
      LOG_DEBUG(<< self->server_ << " " << self->id_ << " timed out, resend");
      self->Send();
      return;
    }
    LOG_DEBUG(<< self->server_ << " " << self->id_ << " timed out");
    self->Finish(boost::asio::error::timed_out);
  });
}

void UdpExchange::HandleServerMessage(MessageReader::Reason reason,
                                      const uint8_t* data, size_t data_size) {
  if (finished_) {
    return;
  }
  switch (reason) {
    case MessageReader::Reason::NEW_MESSAGE:
      if (!request_.Accepts(data, data_size, id_)) {
        LOG_DEBUG(<< server_ << " ignore unmatched datagram of " << data_size
                  << " bytes");
        return;
      }
      Finish(error_code(), std::vector<uint8_t>(data, data + data_size));
      break;
    case MessageReader::Reason::IO_ERROR:
      Finish(message_reader_.error());
      break;
    case MessageReader::Reason::MANUAL_STOPPED:
      Finish(boost::asio::error::operation_aborted);
      break;
  }
}

void UdpExchange::Finish(error_code error, std::vector<uint8_t> message) {
  if (finished_) {
    return;
  }
  finished_ = true;
  timer_.cancel();
  message_reader_.Stop();
  error_code close_error;
  socket_.close(close_error);
  if (close_error) {
    LOG_DEBUG(<< server_ << " close: " << close_error.message());
  }

  auto handler = std::move(handler_);
  if (error) {
    handler(error, std::nullopt);
    return;
  }
  stats_.Finalize();
  handler(error, Answer(std::move(message), stats_));
}

}  // namespace dnsprobe
