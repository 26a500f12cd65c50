#ifndef DNSPROBE_QUERY_H_
#define DNSPROBE_QUERY_H_
#include <functional>
#include <memory>
#include <optional>
#include <vector>
#include "authoritative_resolver.hpp"
#include "client.hpp"
#include "diff.hpp"

namespace dnsprobe {

// The outcome of checking an answer against the authoritative servers.
struct Verification {
  boost::system::error_code error;
  std::vector<Server> authoritative_servers;
  std::optional<Answer> authoritative_answer;
  // no value when the answer sections hold the same records
  std::optional<std::vector<DiffItem>> diff;
};

// A query, optionally followed by the same query sent to the authoritative
// servers of the name and a diff of both answers. A failed verification
// keeps the primary answer.
class VerifiedQuery : public std::enable_shared_from_this<VerifiedQuery> {
 public:
  using pointer = std::shared_ptr<VerifiedQuery>;
  using Handler = std::function<void(boost::system::error_code,
                                     std::optional<Answer>,
                                     std::optional<Verification>)>;

  // without a recursive client the answer is not verified, settings and
  // authoritative_port apply to the authoritative servers
  static pointer create(Client client, const RequestMessage& request,
                        std::optional<Client> recursive_client = std::nullopt,
                        const ServerSettings& settings = ServerSettings(),
                        uint16_t authoritative_port = kDnsPort) {
    return pointer(new VerifiedQuery(std::move(client), request,
                                     std::move(recursive_client), settings,
                                     authoritative_port));
  }

  void Start(Handler handler);

 private:
  VerifiedQuery(Client client, const RequestMessage& request,
                std::optional<Client> recursive_client,
                const ServerSettings& settings, uint16_t authoritative_port)
      : client_(std::move(client)),
        request_(request),
        recursive_client_(std::move(recursive_client)),
        settings_(settings),
        authoritative_port_(authoritative_port) {}

  Client client_;
  RequestMessage request_;
  std::optional<Client> recursive_client_;
  ServerSettings settings_;
  uint16_t authoritative_port_;
  Handler handler_;
  std::optional<Answer> answer_;
  Verification verification_;

  void Verify();
  void QueryAuthoritative(std::vector<Server> servers);
  void FinishVerification(boost::system::error_code error);
};

}  // namespace dnsprobe
#endif  // DNSPROBE_QUERY_H_
