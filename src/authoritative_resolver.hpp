#ifndef DNSPROBE_AUTHORITATIVE_RESOLVER_H_
#define DNSPROBE_AUTHORITATIVE_RESOLVER_H_
#include <boost/asio/ip/address.hpp>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "client.hpp"

namespace dnsprobe {

// Finds the servers that are authoritative for a name by asking a recursive
// resolver for the zone apex (SOA), its NS set and the addresses of every
// name server. Any failed step fails the whole lookup.
class AuthoritativeResolver
    : public std::enable_shared_from_this<AuthoritativeResolver> {
 public:
  using pointer = std::shared_ptr<AuthoritativeResolver>;
  using Handler =
      std::function<void(boost::system::error_code, std::vector<Server>)>;

  // settings and port are applied to the authoritative servers found
  static pointer create(Client recursive_client,
                        const ServerSettings& settings,
                        uint16_t port = kDnsPort) {
    return pointer(new AuthoritativeResolver(std::move(recursive_client),
                                             settings, port));
  }

  void AsyncResolve(const std::string& name, Handler handler);

  // the apex from the response to a SOA query for name, empty if there is no
  // usable SOA record
  static std::string FindApex(const dns::Message& response,
                              const std::string& name);
  // the NS names owned by apex
  static std::vector<std::string> FindNameServers(const dns::Message& response,
                                                  const std::string& apex);

 private:
  AuthoritativeResolver(Client recursive_client,
                        const ServerSettings& settings, uint16_t port)
      : client_(std::move(recursive_client)),
        settings_(settings),
        port_(port) {}

  Client client_;
  ServerSettings settings_;
  uint16_t port_;
  std::string name_;
  Handler handler_;
  std::set<boost::asio::ip::address> addresses_;
  size_t pending_lookups_ = 0;
  boost::system::error_code lookup_error_;
  bool finished_ = false;

  void Query(const std::string& name, dns::TYPE type,
             std::function<void(boost::system::error_code, dns::Message)>
                 handler);
  void LookupApex();
  void LookupNameServers(const std::string& apex);
  void LookupAddresses(const std::vector<std::string>& name_servers);
  void HandleAddressLookup(boost::system::error_code error);
  void Finish(boost::system::error_code error,
              std::vector<Server> servers = {});
};

}  // namespace dnsprobe
#endif  // DNSPROBE_AUTHORITATIVE_RESOLVER_H_
