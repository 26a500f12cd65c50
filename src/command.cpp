#include "command.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <optional>
#include "client.hpp"
#include "engine.hpp"
#include "host_lookup.hpp"
#include "logging.hpp"
#include "output.hpp"
#include "query.hpp"
#include "resolv_conf.hpp"

using boost::asio::ip::make_address;
using boost::asio::ip::tcp;
using boost::system::error_code;
using std::cerr;
using std::cout;
using std::string;
using std::vector;

namespace dnsprobe {

namespace {

ServerSettings GetServerSettings(const Configuration& configuration) {
  ServerSettings settings;
  auto seconds = configuration.get("timeout").as<double>();
  settings.timeout = std::chrono::milliseconds(
      static_cast<int64_t>(std::llround(std::max(seconds, 0.0) * 1000)));
  settings.retries = configuration.get("retries").as<uint16_t>();
  settings.udp_payload_size =
      configuration.get("udp-payload-size").as<uint16_t>();
  return settings;
}

bool IsSet(const Configuration& configuration, const string& name) {
  return configuration.get(name).as<bool>();
}

// the transport picked on the command line, if any
std::optional<Transport> GetTransport(const Configuration& configuration) {
  if (IsSet(configuration, "udp")) {
    return Transport::UDP;
  }
  if (IsSet(configuration, "tls")) {
    return Transport::TLS;
  }
  if (IsSet(configuration, "tcp")) {
    return Transport::TCP;
  }
  return std::nullopt;
}

// --server as an address or a host name, the system resolvers otherwise
bool GetServers(const Configuration& configuration, Transport transport,
                vector<Server>& servers) {
  auto settings = GetServerSettings(configuration);
  std::optional<string> tls_hostname;
  if (configuration.has("tls-hostname")) {
    tls_hostname = configuration.get("tls-hostname").as<string>();
  }

  if (!configuration.has("server")) {
    if (transport == Transport::TLS) {
      cerr << "--server is required for TLS transport\n";
      return false;
    }
    servers = ResolvConf::Load().ToServers();
    if (GetTransport(configuration)) {
      for (auto& server : servers) {
        server.transport = transport;
      }
    }
    return true;
  }

  uint16_t port = transport == Transport::TLS ? kDnsOverTlsPort : kDnsPort;
  if (configuration.has("port")) {
    port = configuration.get("port").as<uint16_t>();
  }
  auto host = configuration.get("server").as<string>();
  error_code error;
  auto server_address = make_address(host, error);
  if (!error) {
    if (transport == Transport::TLS && !tls_hostname) {
      cerr << "--tls-hostname is required for TLS transport\n";
      return false;
    }
    servers.push_back(Server::Create(server_address, port, transport,
                                     settings, tls_hostname));
    return true;
  }

  if (!tls_hostname) {
    tls_hostname = host;
  }
  bool ipv4_only = IsSet(configuration, "ipv4");
  bool ipv6_only = IsSet(configuration, "ipv6");
  tcp::resolver resolver(Engine::get().GetExecutor());
  resolver.async_resolve(
      host, "",
      [&](const error_code& resolve_error,
          const tcp::resolver::results_type& results) {
        if (resolve_error) {
          error = resolve_error;
          return;
        }
        for (auto& entry : results) {
          auto found = entry.endpoint().address();
          if ((found.is_v4() && ipv6_only) || (found.is_v6() && ipv4_only)) {
            continue;
          }
          servers.push_back(
              Server::Create(found, port, transport, settings, tls_hostname));
        }
      });
  Engine::get().Run();
  if (error) {
    cerr << "cannot resolve " << host << ": " << error.message() << "\n";
    return false;
  }
  if (servers.empty()) {
    cerr << "no usable address for " << host << "\n";
    return false;
  }
  return true;
}

RequestFlags GetRequestFlags(const Configuration& configuration) {
  RequestFlags flags;
  flags.recursion_desired = !IsSet(configuration, "no-rd");
  flags.checking_disabled = IsSet(configuration, "cd");
  flags.authentic_data = IsSet(configuration, "ad");
  flags.dnssec_ok = IsSet(configuration, "do");
  return flags;
}

void PullMessages(ResponseStream::pointer stream, int& exit_status) {
  stream->AsyncNext([stream, &exit_status](error_code error,
                                           std::optional<Answer> answer) {
    if (error) {
      cerr << ";; transfer failed: " << error.message() << "\n";
      exit_status = 1;
      return;
    }
    if (!answer) {
      return;
    }
    PrintAnswer(cout, *answer);
    PullMessages(stream, exit_status);
  });
}

}  // namespace

int RunQuery(const Configuration& configuration) {
  auto qname = configuration.get("qname").as<string>();
  error_code error;
  auto qname_address = make_address(qname, error);
  bool is_address = !error;

  uint16_t qtype = dns::ToInt(is_address ? dns::TYPE::PTR : dns::TYPE::AAAA);
  if (configuration.has("qtype")) {
    auto text = configuration.get("qtype").as<string>();
    if (!dns::ParseType(text, qtype)) {
      cerr << "unknown record type " << text << "\n";
      return 1;
    }
  }
  if ((qtype == dns::ToInt(dns::TYPE::Q_AXFR) ||
       qtype == dns::ToInt(dns::TYPE::Q_IXFR)) &&
      !IsSet(configuration, "force")) {
    cerr << "use --xfr for zone transfers, or --force to query anyway\n";
    return 1;
  }
  if (is_address) {
    qname = dns::ReverseName(qname_address);
  }

  auto transport =
      GetTransport(configuration).value_or(Transport::UDP_TCP);
  vector<Server> servers;
  if (!GetServers(configuration, transport, servers)) {
    return 1;
  }

  auto request =
      RequestMessage::Create(qname, qtype, GetRequestFlags(configuration));
  std::optional<Client> recursive_client;
  if (IsSet(configuration, "verify")) {
    recursive_client = Client(ResolvConf::Load().ToServers());
  }

  int exit_status = 0;
  auto query =
      VerifiedQuery::create(Client(std::move(servers)), request,
                            std::move(recursive_client),
                            GetServerSettings(configuration));
  query->Start([&exit_status](error_code error, std::optional<Answer> answer,
                              std::optional<Verification> verification) {
    if (error) {
      cerr << ";; query failed: " << error.message() << "\n";
      exit_status = 1;
      return;
    }
    PrintAnswer(cout, *answer);
    if (verification) {
      PrintVerification(cout, *verification);
    }
  });
  Engine::get().Run();
  return exit_status;
}

int RunXfr(const Configuration& configuration) {
  auto zone = configuration.get("qname").as<string>();
  std::optional<uint32_t> ixfr_serial;
  if (configuration.has("ixfr")) {
    ixfr_serial = configuration.get("ixfr").as<uint32_t>();
  }

  auto transport = GetTransport(configuration).value_or(Transport::TCP);
  if (transport == Transport::UDP) {
    if (!ixfr_serial) {
      cerr << "AXFR requires TCP or TLS\n";
      return 1;
    }
    transport = Transport::UDP_TCP;
  }
  vector<Server> servers;
  if (!GetServers(configuration, transport, servers)) {
    return 1;
  }

  auto request = RequestMessage::CreateXfr(zone, ixfr_serial);
  Client client(std::move(servers));
  int exit_status = 0;
  if (transport == Transport::UDP_TCP) {
    client.AsyncRequest(request, [&exit_status](error_code error,
                                                std::optional<Answer> answer) {
      if (error) {
        cerr << ";; transfer failed: " << error.message() << "\n";
        exit_status = 1;
        return;
      }
      PrintAnswer(cout, *answer);
    });
  } else {
    client.AsyncRequestMulti(
        request,
        [&exit_status](error_code error, ResponseStream::pointer stream) {
          if (error) {
            cerr << ";; transfer failed: " << error.message() << "\n";
            exit_status = 1;
            return;
          }
          PullMessages(stream, exit_status);
        });
  }
  Engine::get().Run();
  LOG_DEBUG(<< zone << " transfer done, status " << exit_status);
  return exit_status;
}

int RunLookup(const Configuration& configuration) {
  vector<string> names{configuration.get("qname").as<string>()};
  if (configuration.has("qtype")) {
    names.push_back(configuration.get("qtype").as<string>());
  }
  if (configuration.has("names")) {
    auto& more = configuration.get("names").as<vector<string>>();
    names.insert(names.end(), more.begin(), more.end());
  }

  auto transport =
      GetTransport(configuration).value_or(Transport::UDP_TCP);
  vector<Server> servers;
  if (!GetServers(configuration, transport, servers)) {
    return 1;
  }
  Client client(std::move(servers));

  bool all_succeeded = true;
  for (size_t i = 0; i < names.size(); i++) {
    if (i > 0) {
      cout << "\n";
    }
    auto& name = names[i];
    auto handler = [&](error_code error, HostLookupResult result) {
      if (error) {
        cerr << name << ": " << error.message() << "\n";
        all_succeeded = false;
        return;
      }
      PrintHostLookup(cout, result);
    };
    error_code error;
    auto host_address = make_address(name, error);
    if (!error) {
      HostLookup::create(client)->AsyncLookupAddress(host_address, handler);
    } else {
      HostLookup::create(client)->AsyncLookupHost(name, handler);
    }
    Engine::get().Run();
  }
  if (!all_succeeded) {
    cerr << "not all lookups have succeeded\n";
    return 1;
  }
  return 0;
}

}  // namespace dnsprobe
