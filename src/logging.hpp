#ifndef DNSPROBE_LOGGING_H_
#define DNSPROBE_LOGGING_H_

#include <boost/log/trivial.hpp>

namespace dnsprobe {
void InitLogging(boost::log::trivial::severity_level minimum_level =
                     boost::log::trivial::error);
}  // namespace dnsprobe

#define DNSPROBE_LOG_TRIVIAL2(severity, color, line) \
  BOOST_LOG_TRIVIAL(severity)                        \
      << color __FILE__ ":" #line " " << __FUNCTION__ << ": "

#define DNSPROBE_LOG_TRIVIAL(severity, color, line) \
  DNSPROBE_LOG_TRIVIAL2(severity, color, line)

#ifdef NDEBUG
#define LOG_TRACE(expression)
#define LOG_DEBUG(expression)
#else
#define LOG_TRACE(expression) \
  DNSPROBE_LOG_TRIVIAL(trace, "\e[90m", __LINE__) expression
#define LOG_DEBUG(expression) \
  DNSPROBE_LOG_TRIVIAL(debug, "\e[37m", __LINE__) expression
#endif

#define LOG_INFO(expression) \
  DNSPROBE_LOG_TRIVIAL(info, "\e[39m", __LINE__) expression
#define LOG_ERROR(expression) \
  DNSPROBE_LOG_TRIVIAL(error, "\e[91m", __LINE__) expression

#endif  // DNSPROBE_LOGGING_H_
