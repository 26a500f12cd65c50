#include "logging.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <iostream>

namespace dnsprobe {

namespace expr = boost::log::expressions;

const auto date_time_formatter =
    expr::stream << expr::format_date_time<boost::posix_time::ptime>(
                        "TimeStamp", "%m%d %H:%M:%S.%f ")
                 << expr::message << "\e[0m";

void InitLogging(boost::log::trivial::severity_level minimum_level) {
  static bool initialized = false;
  if (!initialized) {
    boost::log::add_common_attributes();
    boost::log::add_console_log(std::clog)->set_formatter(date_time_formatter);
    initialized = true;
  }
  boost::log::core::get()->set_filter(boost::log::trivial::severity >=
                                      minimum_level);
}

}  // namespace dnsprobe
