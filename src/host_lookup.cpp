#include "host_lookup.hpp"

#include "error.hpp"
#include "logging.hpp"

using boost::asio::ip::address;
using boost::system::error_code;
using std::string;
using std::vector;

namespace dnsprobe {

void HostLookup::AsyncLookupHost(const string& name, Handler handler) {
  result_.name = name;
  result_.canonical_name = dns::NormalizeName(name);
  handler_ = std::move(handler);
  pending_ = 2;
  for (auto type : {dns::TYPE::A, dns::TYPE::AAAA}) {
    Query(name, type,
          [self = shared_from_this(), type](error_code error,
                                            dns::Message response) {
            self->HandleHostAnswer(error, response, type);
          });
  }
}

void HostLookup::HandleHostAnswer(error_code error,
                                  const dns::Message& response,
                                  dns::TYPE type) {
  if (error) {
    LOG_DEBUG(<< result_.name << " " << dns::TypeToString(dns::ToInt(type))
              << " " << error.message());
    error_ = error;
  } else {
    auto qname = dns::NormalizeName(result_.name);
    // the A answer names the canonical name when both have one
    if (!resolved_ || type == dns::TYPE::A) {
      result_.canonical_name = CanonicalName(response, qname);
    }
    auto found = FindAddresses(response, qname);
    // A addresses first
    auto position = type == dns::TYPE::A ? result_.addresses.begin()
                                         : result_.addresses.end();
    result_.addresses.insert(position, found.begin(), found.end());
    resolved_ = true;
  }
  if (--pending_ > 0) {
    return;
  }
  auto handler = std::move(handler_);
  handler(resolved_ ? error_code() : error_, std::move(result_));
}

void HostLookup::AsyncLookupAddress(const address& host_address,
                                    Handler handler) {
  result_.name = host_address.to_string();
  handler_ = std::move(handler);
  auto reverse_name = dns::ReverseName(host_address);
  Query(reverse_name, dns::TYPE::PTR,
        [self = shared_from_this(), reverse_name](error_code error,
                                                  dns::Message response) {
          if (!error) {
            self->result_.host_names = FindHostNames(response, reverse_name);
          }
          auto handler = std::move(self->handler_);
          handler(error, std::move(self->result_));
        });
}

string HostLookup::CanonicalName(const dns::Message& response,
                                 const string& name) {
  string target = dns::NormalizeName(name);
  // every hop moves the target, bounded by the answer count
  for (size_t hop = 0; hop < response.answers.size(); hop++) {
    bool followed = false;
    for (auto& record : response.answers) {
      if (record.type != dns::ToInt(dns::TYPE::CNAME) ||
          record.the_class != dns::ToInt(dns::CLASS::IN) ||
          !dns::NameEquals(record.name, target)) {
        continue;
      }
      string canonical_name;
      if (dns::rdata::ToName(record.rdata, canonical_name)) {
        target = canonical_name;
        followed = true;
        break;
      }
    }
    if (!followed) {
      break;
    }
  }
  return target;
}

vector<address> HostLookup::FindAddresses(const dns::Message& response,
                                          const string& name) {
  vector<address> result;
  auto target = CanonicalName(response, name);
  for (auto& record : response.answers) {
    if (record.the_class != dns::ToInt(dns::CLASS::IN) ||
        !dns::NameEquals(record.name, target)) {
      continue;
    }
    address found;
    if (dns::rdata::ToAddress(record.type, record.rdata, found)) {
      result.push_back(found);
    }
  }
  return result;
}

vector<string> HostLookup::FindHostNames(const dns::Message& response,
                                         const string& name) {
  vector<string> result;
  auto target = CanonicalName(response, name);
  for (auto& record : response.answers) {
    if (record.type != dns::ToInt(dns::TYPE::PTR) ||
        record.the_class != dns::ToInt(dns::CLASS::IN) ||
        !dns::NameEquals(record.name, target)) {
      continue;
    }
    string host_name;
    if (dns::rdata::ToName(record.rdata, host_name)) {
      result.push_back(std::move(host_name));
    }
  }
  return result;
}

void HostLookup::Query(const string& name, dns::TYPE type,
                       std::function<void(error_code, dns::Message)> handler) {
  auto request = RequestMessage::Create(name, dns::ToInt(type));
  client_.AsyncRequest(request, [handler](error_code error,
                                          std::optional<Answer> answer) {
    dns::Message response;
    if (error) {
      handler(error, std::move(response));
      return;
    }
    if (answer->Decode(response) != dns::MessageDecoder::ResultType::good) {
      handler(Error::malformed_response, std::move(response));
      return;
    }
    handler(error, std::move(response));
  });
}

}  // namespace dnsprobe
