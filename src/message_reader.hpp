#ifndef DNSPROBE_MESSAGE_READER_H_
#define DNSPROBE_MESSAGE_READER_H_
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/endian/conversion.hpp>
#include <cstring>
#include <functional>
#include <vector>
#include "dns.hpp"
#include "logging.hpp"

namespace dnsprobe {

// Read loop of a socket, every complete DNS message is handed to the handler
// until the reader is stopped or the socket fails. Stream messages are handed
// over without their length prefix.
class MessageReader {
 public:
  enum class Reason {
    NEW_MESSAGE,
    IO_ERROR,
    MANUAL_STOPPED,
  };

  using HandlerTypeExample =
      std::function<void(Reason, const uint8_t*, size_t)>;

  void resize_buffer(size_t size) { buffer_.resize(size); }

  void reset() {
    status_ = Status::STOP;
    data_size_ = 0;
    tcp_message_size_ = 0;
    error_.clear();
  }

  // the error behind the last IO_ERROR
  const boost::system::error_code& error() const { return error_; }

  template <typename StreamType, typename HandlerType>
  void Start(StreamType& stream, HandlerType&& handler) {
    if (status_ != Status::RUNNING) {
      status_ = Status::RUNNING;
      if (buffer_.size() == 0) {
        buffer_.resize(kDefaultBufferSize);
      }
      if constexpr (std::is_same<StreamType,
                                 boost::asio::ip::udp::socket>::value) {
        DoReadUdp(stream, std::forward<HandlerType>(handler));
      } else {
        DoReadStream(stream, std::forward<HandlerType>(handler));
      }
    }
  }

  void Stop() { status_ = Status::STOP; }

 private:
  static constexpr size_t kDefaultBufferSize = 4096;

  enum class Status { STOP, RUNNING } status_ = Status::STOP;
  size_t data_size_ = 0;
  // prefix included, 0 while the prefix is incomplete
  size_t tcp_message_size_ = 0;
  boost::system::error_code error_;

  std::vector<uint8_t> buffer_;

  template <typename HandlerType>
  bool HandleReadError(const boost::system::error_code& error,
                       HandlerType& handler) {
    status_ = Status::STOP;
    if (error == boost::asio::error::operation_aborted) {
      LOG_TRACE("connection closed");
      handler(Reason::MANUAL_STOPPED, nullptr, 0);
      return true;
    }
    LOG_DEBUG(<< error.message());
    error_ = error;
    handler(Reason::IO_ERROR, nullptr, 0);
    return true;
  }

  template <typename StreamType, typename HandlerType>
  void DoReadStream(StreamType& stream, HandlerType&& handler) {
    if (status_ == Status::STOP) {
      handler(Reason::MANUAL_STOPPED, nullptr, 0);
      LOG_TRACE("manual stopped");
      return;
    }
    if (!stream.lowest_layer().is_open()) {
      handler(Reason::MANUAL_STOPPED, nullptr, 0);
      status_ = Status::STOP;
      LOG_TRACE("connection closed");
      return;
    }
    auto wanted_size = tcp_message_size_
                           ? tcp_message_size_
                           : sizeof(dns::RawTcpMessage::message_length);
    auto read_size = wanted_size - data_size_;
    if (buffer_.size() < wanted_size) {
      buffer_.resize(wanted_size);
    }
    auto read_buffer = buffer_.data() + data_size_;
    auto available_size = buffer_.size() - data_size_;

    LOG_TRACE("start async_read " << read_size);

    auto boost_handler = [this, &stream, handler = std::move(handler)](
                             boost::system::error_code error,
                             size_t new_data_size) mutable {
      if (error) {
        HandleReadError(error, handler);
        return;
      }
      LOG_TRACE("Income data " << new_data_size);
      data_size_ += new_data_size;
      size_t data_offset = 0;
      while (status_ == Status::RUNNING) {
        auto data = buffer_.data() + data_offset;
        auto size = data_size_ - data_offset;
        if (tcp_message_size_ == 0) {
          uint16_t message_size;
          if (dns::MessageDecoder::ReadMessageSizeFromTcpMessage(
                  data, size, message_size) !=
              dns::MessageDecoder::ResultType::good) {
            break;
          }
          tcp_message_size_ =
              sizeof(dns::RawTcpMessage::message_length) + message_size;
        }
        if (size < tcp_message_size_) {
          LOG_DEBUG("Message " << size << "/" << tcp_message_size_);
          break;
        }
        auto prefix_size = offsetof(dns::RawTcpMessage, message);
        data_offset += tcp_message_size_;
        auto message_size = tcp_message_size_ - prefix_size;
        tcp_message_size_ = 0;
        handler(Reason::NEW_MESSAGE, data + prefix_size, message_size);
      }
      // keep the incomplete tail at the beginning of the buffer
      data_size_ -= data_offset;
      if (data_offset && data_size_) {
        std::memmove(buffer_.data(), buffer_.data() + data_offset, data_size_);
      }
      DoReadStream(stream, std::move(handler));
    };

    boost::asio::async_read(
        stream, boost::asio::buffer(read_buffer, available_size),
        boost::asio::transfer_at_least(read_size), std::move(boost_handler));
  }

  template <typename HandlerType>
  void DoReadUdp(boost::asio::ip::udp::socket& socket, HandlerType&& handler) {
    if (status_ == Status::STOP) {
      handler(Reason::MANUAL_STOPPED, nullptr, 0);
      LOG_TRACE("manual stopped");
      return;
    }
    if (!socket.is_open()) {
      handler(Reason::MANUAL_STOPPED, nullptr, 0);
      status_ = Status::STOP;
      LOG_TRACE("connection closed");
      return;
    }
    // connected socket, only datagrams of the peer arrive
    socket.async_receive(
        boost::asio::buffer(buffer_),
        [this, &socket, handler = std::move(handler)](
            boost::system::error_code error, size_t data_size) mutable {
          if (error) {
            HandleReadError(error, handler);
            return;
          }
          handler(Reason::NEW_MESSAGE, buffer_.data(), data_size);
          DoReadUdp(socket, std::move(handler));
        });
  }
};

}  // namespace dnsprobe
#endif  // DNSPROBE_MESSAGE_READER_H_
