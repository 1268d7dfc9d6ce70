#include <splittar/error.hxx>
#include <splittar/logging.hxx>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <iostream>
#include <string>

namespace splittar {

namespace logging = boost::log;
namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;

void init_logging(severity_level level) {
  logging::core::get()->remove_all_sinks();
  logging::add_console_log(
      std::clog,
      keywords::format =
          (expr::stream << "["
                        << expr::format_date_time<boost::posix_time::ptime>(
                               "TimeStamp", "%Y-%m-%d %H:%M:%S")
                        << "] [" << logging::trivial::severity
                        << "]: " << expr::smessage));
  logging::core::get()->set_filter(logging::trivial::severity >= level);
  logging::add_common_attributes();
}

severity_level parse_log_level(std::string_view name) {
  auto const lower = boost::algorithm::to_lower_copy(std::string(name));
  if (lower == "trace")
    return logging::trivial::trace;
  if (lower == "debug")
    return logging::trivial::debug;
  if (lower == "info")
    return logging::trivial::info;
  if (lower == "warning" || lower == "warn")
    return logging::trivial::warning;
  if (lower == "error")
    return logging::trivial::error;
  if (lower == "fatal")
    return logging::trivial::fatal;
  throw ConfigError("unknown log level \"" + std::string(name) + "\"");
}

} // namespace splittar
