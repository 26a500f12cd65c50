#ifndef DNSPROBE_CONFIGURATION_H_
#define DNSPROBE_CONFIGURATION_H_

#include <boost/program_options.hpp>
#include <string>

namespace dnsprobe {

// Command line and config file options. Options given on the command line
// take precedence over the config file.
class Configuration {
 public:
  inline const boost::program_options::variable_value& get(
      const std::string& name) const {
    return variables_[name];
  }

  inline bool has(const std::string& name) const {
    return variables_.count(name) > 0 && !variables_[name].defaulted();
  }

  // 0 to go on, 1 when help was printed, -1 on an invalid command line
  int Init(int argc, const char* const argv[]);

 private:
  boost::program_options::variables_map variables_;
};

}  // namespace dnsprobe

#endif  // DNSPROBE_CONFIGURATION_H_
