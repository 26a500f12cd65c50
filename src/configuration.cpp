#include "configuration.hpp"

#include <boost/log/trivial.hpp>
#include <fstream>
#include <iostream>
#include <vector>

namespace dnsprobe {

int Configuration::Init(int argc, const char* const argv[]) {
  namespace bpo = boost::program_options;
  using boost::log::trivial::severity_level;
  using std::cerr;
  using std::cout;
  using std::string;

  bpo::options_description commandline_options("Commandline options");
  auto add_commandline_option = commandline_options.add_options();
  add_commandline_option("help,h", "produce help message");
  add_commandline_option(
      "config", bpo::value<string>()->default_value("./dnsprobe.conf"),
      "specify config file");

  bpo::options_description configurations("Query options");
  auto add_configuration_option = configurations.add_options();
  add_configuration_option("qname", bpo::value<string>(),
                           "name or address to query");
  add_configuration_option("qtype", bpo::value<string>(),
                           "record type, AAAA for names and PTR for addresses "
                           "when omitted");
  add_configuration_option("server,s", bpo::value<string>(),
                           "server address or host name, the system "
                           "resolvers when omitted");
  add_configuration_option("port,p", bpo::value<uint16_t>(),
                           "server port, 853 for TLS and 53 otherwise");
  add_configuration_option("ipv4,4", bpo::bool_switch(),
                           "only use IPv4 addresses of a server host name");
  add_configuration_option("ipv6,6", bpo::bool_switch(),
                           "only use IPv6 addresses of a server host name");
  add_configuration_option("tcp,t", bpo::bool_switch(), "use only TCP");
  add_configuration_option("udp,u", bpo::bool_switch(),
                           "use only UDP, no TCP fallback on truncation");
  add_configuration_option("tls", bpo::bool_switch(), "use DNS over TLS");
  add_configuration_option("tls-hostname", bpo::value<string>(),
                           "server name for SNI and certificate validation");
  add_configuration_option("timeout", bpo::value<double>()->default_value(5),
                           "read timeout of a single attempt in seconds");
  add_configuration_option("retries",
                           bpo::value<uint16_t>()->default_value(2),
                           "UDP retransmissions after the first datagram");
  add_configuration_option("udp-payload-size",
                           bpo::value<uint16_t>()->default_value(1232),
                           "advertised EDNS UDP payload size");
  add_configuration_option("ad", bpo::bool_switch(), "set the AD flag");
  add_configuration_option("cd", bpo::bool_switch(), "set the CD flag");
  add_configuration_option("do", bpo::bool_switch(), "set the DNSSEC OK bit");
  add_configuration_option("no-rd", bpo::bool_switch(),
                           "clear the recursion desired flag");
  add_configuration_option("verify", bpo::bool_switch(),
                           "compare the answer with the authoritative one");
  add_configuration_option("xfr", bpo::bool_switch(),
                           "transfer the zone qname");
  add_configuration_option("ixfr", bpo::value<uint32_t>(),
                           "incremental transfer from this SOA serial");
  add_configuration_option("lookup", bpo::bool_switch(),
                           "look up the addresses of host names or the host "
                           "names of addresses given as arguments");
  add_configuration_option("force,f", bpo::bool_switch(),
                           "allow AXFR and IXFR as a query type");
  add_configuration_option(
      "log-level",
      bpo::value<severity_level>()->default_value(severity_level::error),
      "trace, debug, info, warning, error or fatal");

  // more hosts for --lookup
  bpo::options_description hidden_options;
  hidden_options.add_options()("names",
                               bpo::value<std::vector<string>>());

  bpo::options_description visible_options;
  visible_options.add(commandline_options).add(configurations);
  bpo::options_description all_options;
  all_options.add(visible_options).add(hidden_options);
  bpo::positional_options_description positional;
  positional.add("qname", 1).add("qtype", 1).add("names", -1);

  try {
    bpo::store(bpo::command_line_parser(argc, argv)
                   .options(all_options)
                   .positional(positional)
                   .run(),
               variables_);
    if (variables_.count("help")) {
      cout << "Usage: dnsprobe [options] qname [qtype]\n"
           << "       dnsprobe [options] --lookup host_or_address...\n"
           << visible_options << "\n";
      return 1;
    }
    std::ifstream config_file(variables_["config"].as<string>());
    if (config_file) {
      bpo::store(bpo::parse_config_file(config_file, configurations),
                 variables_);
    }
    bpo::notify(variables_);
  } catch (const bpo::error& e) {
    cerr << e.what() << "\n";
    return -1;
  }

  if (!variables_.count("qname")) {
    cerr << "missing qname\n";
    return -1;
  }
  if (variables_.count("names") && !variables_["lookup"].as<bool>()) {
    cerr << "too many arguments\n";
    return -1;
  }
  return 0;
}

}  // namespace dnsprobe
