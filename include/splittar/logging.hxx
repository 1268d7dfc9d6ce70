/**
 * @file logging.hxx
 * @brief Boost.Log console setup for the splittar tool.
 */

#pragma once

#include <boost/log/trivial.hpp>

#include <string_view>

namespace splittar {

using severity_level = boost::log::trivial::severity_level;

/**
 * @brief Route log records at or above @p level to std::clog.
 *
 * Standard output is left alone because it may carry the archive.
 */
void init_logging(severity_level level);

/**
 * @brief Map "trace", "debug", "info", "warning" (or "warn"), "error" or
 * "fatal", in any letter case, to a severity.
 *
 * @throws ConfigError for any other name.
 */
severity_level parse_log_level(std::string_view name);

} // namespace splittar
