#include "error.hpp"

#include <string>

namespace dnsprobe {

namespace {

class ErrorCategory : public boost::system::error_category {
 public:
  const char* name() const noexcept override { return "dnsprobe"; }

  std::string message(int value) const override {
    switch (static_cast<Error>(value)) {
      case Error::no_servers:
        return "no server to query";
      case Error::multi_over_datagram:
        return "multiple responses requested over a datagram transport";
      case Error::missing_tls_hostname:
        return "TLS requires a server hostname";
      case Error::invalid_tls_hostname:
        return "invalid TLS server hostname";
      case Error::invalid_request:
        return "request can not be encoded";
      case Error::malformed_response:
        return "malformed response";
      case Error::no_soa_record:
        return "no SOA record";
      case Error::no_ns_records:
        return "no NS records";
      case Error::no_addresses:
        return "no nameserver addresses";
    }
    return "unknown dnsprobe error";
  }
};

}  // namespace

const boost::system::error_category& GetErrorCategory() {
  static const ErrorCategory category{};
  return category;
}

bool IsConfigurationError(const boost::system::error_code& error) {
  if (error.category() != GetErrorCategory()) {
    return false;
  }
  switch (static_cast<Error>(error.value())) {
    case Error::no_servers:
    case Error::multi_over_datagram:
    case Error::missing_tls_hostname:
    case Error::invalid_tls_hostname:
    case Error::invalid_request:
      return true;
    default:
      return false;
  }
}

bool IsVerificationError(const boost::system::error_code& error) {
  if (error.category() != GetErrorCategory()) {
    return false;
  }
  switch (static_cast<Error>(error.value())) {
    case Error::no_soa_record:
    case Error::no_ns_records:
    case Error::no_addresses:
      return true;
    default:
      return false;
  }
}

}  // namespace dnsprobe
