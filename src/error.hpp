#ifndef DNSPROBE_ERROR_H_
#define DNSPROBE_ERROR_H_

#include <boost/system/error_code.hpp>
#include <type_traits>

namespace dnsprobe {

enum class Error {
  // configuration, reported before any I/O
  no_servers = 1,
  multi_over_datagram,
  missing_tls_hostname,
  invalid_tls_hostname,
  invalid_request,
  // protocol
  malformed_response,
  // verification
  no_soa_record,
  no_ns_records,
  no_addresses,
};

const boost::system::error_category& GetErrorCategory();

inline boost::system::error_code make_error_code(Error error) {
  return boost::system::error_code(static_cast<int>(error),
                                   GetErrorCategory());
}

bool IsConfigurationError(const boost::system::error_code& error);
bool IsVerificationError(const boost::system::error_code& error);

}  // namespace dnsprobe

namespace boost {
namespace system {
template <>
struct is_error_code_enum<dnsprobe::Error> : std::true_type {};
}  // namespace system
}  // namespace boost

#endif  // DNSPROBE_ERROR_H_
