#ifndef DNSPROBE_HOST_LOOKUP_H_
#define DNSPROBE_HOST_LOOKUP_H_
#include <boost/asio/ip/address.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "client.hpp"

namespace dnsprobe {

struct HostLookupResult {
  // the host name or address as it was asked for
  std::string name;
  // end of the CNAME chain of a forward lookup
  std::string canonical_name;
  std::vector<boost::asio::ip::address> addresses;
  // PTR targets of a reverse lookup
  std::vector<std::string> host_names;
};

// Looks up the addresses of a host (A and AAAA) or the host names of an
// address (PTR) through a recursive resolver.
class HostLookup : public std::enable_shared_from_this<HostLookup> {
 public:
  using pointer = std::shared_ptr<HostLookup>;
  using Handler =
      std::function<void(boost::system::error_code, HostLookupResult)>;

  static pointer create(Client client) {
    return pointer(new HostLookup(std::move(client)));
  }

  // fails only when both the A and the AAAA query fail
  void AsyncLookupHost(const std::string& name, Handler handler);
  void AsyncLookupAddress(const boost::asio::ip::address& address,
                          Handler handler);

  // the name the CNAME records of the answer section lead to from name
  static std::string CanonicalName(const dns::Message& response,
                                   const std::string& name);
  // A and AAAA data owned by the canonical name of name
  static std::vector<boost::asio::ip::address> FindAddresses(
      const dns::Message& response, const std::string& name);
  // PTR data owned by the canonical name of name
  static std::vector<std::string> FindHostNames(const dns::Message& response,
                                                const std::string& name);

 private:
  explicit HostLookup(Client client) : client_(std::move(client)) {}

  Client client_;
  HostLookupResult result_;
  Handler handler_;
  int pending_ = 0;
  bool resolved_ = false;
  boost::system::error_code error_;

  void Query(const std::string& name, dns::TYPE type,
             std::function<void(boost::system::error_code, dns::Message)>
                 handler);
  void HandleHostAnswer(boost::system::error_code error,
                        const dns::Message& response, dns::TYPE type);
};

}  // namespace dnsprobe
#endif  // DNSPROBE_HOST_LOOKUP_H_
