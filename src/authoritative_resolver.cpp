#include "authoritative_resolver.hpp"

#include "error.hpp"
#include "host_lookup.hpp"
#include "logging.hpp"

using boost::system::error_code;
using std::string;
using std::vector;

namespace dnsprobe {

void AuthoritativeResolver::AsyncResolve(const string& name, Handler handler) {
  name_ = dns::NormalizeName(name);
  handler_ = std::move(handler);
  LookupApex();
}

string AuthoritativeResolver::FindApex(const dns::Message& response,
                                       const string& name) {
  auto is_soa = [](const dns::ResourceRecord& record) {
    return record.type == dns::ToInt(dns::TYPE::SOA) &&
           record.the_class == dns::ToInt(dns::CLASS::IN);
  };
  // the first SOA of the answer section only, a SOA of another owner there
  // falls through to the authority section
  for (auto& record : response.answers) {
    if (!is_soa(record)) {
      continue;
    }
    if (dns::NameEquals(record.name, name)) {
      return dns::NormalizeName(name);
    }
    break;
  }
  for (auto& record : response.authorities) {
    if (is_soa(record)) {
      return record.name;
    }
  }
  return string();
}

vector<string> AuthoritativeResolver::FindNameServers(
    const dns::Message& response, const string& apex) {
  vector<string> result;
  for (auto& record : response.answers) {
    if (record.type != dns::ToInt(dns::TYPE::NS) ||
        record.the_class != dns::ToInt(dns::CLASS::IN) ||
        !dns::NameEquals(record.name, apex)) {
      continue;
    }
    string name_server;
    if (dns::rdata::ToName(record.rdata, name_server)) {
      result.push_back(std::move(name_server));
    }
  }
  return result;
}

void AuthoritativeResolver::Query(
    const string& name, dns::TYPE type,
    std::function<void(error_code, dns::Message)> handler) {
  auto request = RequestMessage::Create(name, dns::ToInt(type));
  client_.AsyncRequest(
      request, [name, type, handler](error_code error,
                                     std::optional<Answer> answer) {
        dns::Message response;
        if (error) {
          handler(error, std::move(response));
          return;
        }
        auto& raw = answer->raw_message();
        if (dns::MessageDecoder::DecodeCompleteMessage(
                response, raw.data(), raw.size()) !=
            dns::MessageDecoder::ResultType::good) {
          LOG_DEBUG(<< name << " " << dns::TypeToString(dns::ToInt(type))
                    << " malformed response");
          handler(Error::malformed_response, std::move(response));
          return;
        }
        handler(error, std::move(response));
      });
}

void AuthoritativeResolver::LookupApex() {
  LOG_DEBUG(<< name_ << " looking up SOA");
  Query(name_, dns::TYPE::SOA,
        [self = shared_from_this()](error_code error, dns::Message response) {
          if (error) {
            self->Finish(error);
            return;
          }
          auto apex = FindApex(response, self->name_);
          if (apex.empty()) {
            self->Finish(Error::no_soa_record);
            return;
          }
          LOG_DEBUG(<< self->name_ << " apex " << apex);
          self->LookupNameServers(apex);
        });
}

void AuthoritativeResolver::LookupNameServers(const string& apex) {
  Query(apex, dns::TYPE::NS,
        [self = shared_from_this(), apex](error_code error,
                                          dns::Message response) {
          if (error) {
            self->Finish(error);
            return;
          }
          auto name_servers = FindNameServers(response, apex);
          if (name_servers.empty()) {
            self->Finish(Error::no_ns_records);
            return;
          }
          LOG_DEBUG(<< apex << " has " << name_servers.size()
                    << " name servers");
          self->LookupAddresses(name_servers);
        });
}

void AuthoritativeResolver::LookupAddresses(
    const vector<string>& name_servers) {
  pending_lookups_ = name_servers.size();
  for (auto& name_server : name_servers) {
    HostLookup::create(client_)->AsyncLookupHost(
        name_server, [self = shared_from_this(), name_server](
                         error_code error, HostLookupResult result) {
          if (error) {
            LOG_DEBUG(<< name_server
                      << " address lookup failed: " << error.message());
          }
          for (auto& found : result.addresses) {
            self->addresses_.insert(found);
          }
          self->HandleAddressLookup(error);
        });
  }
}

void AuthoritativeResolver::HandleAddressLookup(error_code error) {
  if (error && !lookup_error_) {
    lookup_error_ = error;
  }
  if (--pending_lookups_ > 0) {
    return;
  }
  if (lookup_error_) {
    Finish(lookup_error_);
    return;
  }
  if (addresses_.empty()) {
    Finish(Error::no_addresses);
    return;
  }
  vector<Server> servers;
  for (auto& found : addresses_) {
    servers.push_back(
        Server::Create(found, port_, Transport::UDP_TCP, settings_));
  }
  LOG_DEBUG(<< name_ << " " << servers.size() << " authoritative servers");
  Finish(error_code(), std::move(servers));
}

void AuthoritativeResolver::Finish(error_code error, vector<Server> servers) {
  if (finished_) {
    return;
  }
  finished_ = true;
  if (error) {
    LOG_DEBUG(<< name_ << " " << error.message());
  }
  auto handler = std::move(handler_);
  handler(error, std::move(servers));
}

}  // namespace dnsprobe
