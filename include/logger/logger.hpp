#ifndef CFS_LOGGER_HPP
#define CFS_LOGGER_HPP

#include <optional>
#include <string>
#include <boost/log/trivial.hpp>

namespace cfs::logging {

using severity_level = boost::log::trivial::severity_level;

// Parses "trace", "debug", "info", "warning", "error" or "fatal"
std::optional<severity_level> parse_severity(const std::string& name);

// Routes all BOOST_LOG_TRIVIAL output to log_file (appending) with timestamps
void init_logging(const std::string& log_file = "cfs.log",
                  severity_level min_level = severity_level::info);

// Changes the minimum severity written by the active sinks
void set_log_level(severity_level min_level);

} // namespace cfs::logging

#endif // CFS_LOGGER_HPP
