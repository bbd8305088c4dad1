#ifndef LFS_LOGGER_HPP
#define LFS_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <optional>
#include <string>

namespace lfs::logging {

using severity_level = boost::log::trivial::severity_level;

// Installs a single sink: a text file sink when log_file is non-empty,
// a console sink on stderr otherwise
void init_logging(const std::string& log_file = "",
                  severity_level min_level = boost::log::trivial::info);

// Changes the severity filter of the already initialized core
void set_log_level(severity_level min_level);

// Maps "trace", "debug", "info", "warning", "error" and "fatal"
std::optional<severity_level> parse_severity(const std::string& name);

} // namespace lfs::logging

#endif // LFS_LOGGER_HPP
