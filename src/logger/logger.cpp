#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <filesystem>
#include <iostream>

namespace lfs::logging {

namespace {

auto make_formatter() {
  namespace expr = boost::log::expressions;
  return expr::stream
    << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
    << " [" << boost::log::trivial::severity << "] "
    << expr::smessage;
}

} // namespace

void init_logging(const std::string& log_file, severity_level min_level) {
  try {
    // Clear any existing sinks
    boost::log::core::get()->remove_all_sinks();

    if (!log_file.empty()) {
      auto backend = boost::make_shared<boost::log::sinks::text_file_backend>();

      std::filesystem::path log_path = std::filesystem::absolute(log_file);
      backend->set_file_name_pattern(log_path.string());
      backend->set_open_mode(std::ios::out | std::ios::app);
      backend->auto_flush(true);

      using file_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
      auto sink = boost::make_shared<file_sink>(backend);
      sink->set_formatter(make_formatter());
      boost::log::core::get()->add_sink(sink);
    } else {
      auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
      backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
      backend->auto_flush(true);

      using console_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;
      auto sink = boost::make_shared<console_sink>(backend);
      sink->set_formatter(make_formatter());
      boost::log::core::get()->add_sink(sink);
    }

    boost::log::add_common_attributes();
    set_log_level(min_level);
    boost::log::core::get()->set_logging_enabled(true);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void set_log_level(severity_level min_level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

std::optional<severity_level> parse_severity(const std::string& name) {
  if (name == "trace")   return boost::log::trivial::trace;
  if (name == "debug")   return boost::log::trivial::debug;
  if (name == "info")    return boost::log::trivial::info;
  if (name == "warning") return boost::log::trivial::warning;
  if (name == "error")   return boost::log::trivial::error;
  if (name == "fatal")   return boost::log::trivial::fatal;
  return std::nullopt;
}

} // namespace lfs::logging
