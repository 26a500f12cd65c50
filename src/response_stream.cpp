#include "response_stream.hpp"

#include "engine.hpp"
#include "error.hpp"
#include "logging.hpp"

using boost::system::error_code;

namespace dnsprobe {

ResponseStream::ResponseStream(Connection connection,
                               const RequestMessage& request, uint16_t id,
                               Stats stats)
    : connection_(std::move(connection)),
      request_(request),
      id_(id),
      stats_(stats),
      tracker_(request.ixfr_serial()) {}

ResponseStream::~ResponseStream() { Close(); }

void ResponseStream::AsyncNext(Handler handler) {
  if (complete_) {
    boost::asio::post(Engine::get().GetExecutor(),
                      [handler]() { handler(error_code(), std::nullopt); });
    return;
  }
  std::weak_ptr<ResponseStream> weak_self = shared_from_this();
  auto on_message = [weak_self, handler](
                        error_code error,
                        std::optional<std::vector<uint8_t>> message) {
    auto self = weak_self.lock();
    if (!self) {
      handler(boost::asio::error::operation_aborted, std::nullopt);
      return;
    }
    self->HandleMessage(error, std::move(message), handler);
  };
  std::visit(
      [&on_message](auto& connection) {
        connection->AsyncNext(std::move(on_message));
      },
      connection_);
}

void ResponseStream::Close() {
  std::visit([](auto& connection) { connection->Close(); }, connection_);
}

void ResponseStream::HandleMessage(error_code error,
                                   std::optional<std::vector<uint8_t>> message,
                                   const Handler& handler) {
  if (complete_) {
    handler(error_code(), std::nullopt);
    return;
  }
  if (error || !message) {
    LOG_DEBUG(<< request_.question().name << " stream ended after "
              << received_ << " messages: " << error.message());
    handler(error ? error : make_error_code(boost::asio::error::eof),
            std::nullopt);
    return;
  }

  bool follow_up = received_ > 0 && request_.is_streaming();
  if (!request_.Accepts(message->data(), message->size(), id_, follow_up)) {
    LOG_DEBUG(<< request_.question().name << " unexpected message of "
              << message->size() << " bytes");
    Close();
    handler(Error::malformed_response, std::nullopt);
    return;
  }
  received_++;

  if (!request_.is_streaming()) {
    complete_ = true;
  } else {
    dns::Message decoded;
    if (dns::MessageDecoder::DecodeMessageLeniently(
            decoded, message->data(), message->size()) !=
        dns::MessageDecoder::ResultType::good) {
      Close();
      handler(Error::malformed_response, std::nullopt);
      return;
    }
    switch (tracker_.Feed(decoded)) {
      case XfrTracker::ResultType::good:
        complete_ = true;
        break;
      case XfrTracker::ResultType::bad:
        LOG_DEBUG(<< request_.question().name << " transfer rejected");
        Close();
        handler(Error::malformed_response, std::nullopt);
        return;
      case XfrTracker::ResultType::indeterminate:
        break;
    }
  }
  if (complete_) {
    LOG_TRACE(<< request_.question().name << " complete after " << received_
              << " messages");
    Close();
  }

  auto stats = stats_;
  stats.Finalize();
  handler(error_code(), Answer(std::move(*message), stats));
}

}  // namespace dnsprobe
