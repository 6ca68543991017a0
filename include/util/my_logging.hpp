#pragma once

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/shared_ptr.hpp>

#include <fmt/format.h>
#include <string>

#include "conf/logging_config.hpp"

namespace logging = boost::log;
namespace src = boost::log::sources;
namespace sinks = boost::log::sinks;
namespace trivial = logging::trivial;

BOOST_LOG_INLINE_GLOBAL_LOGGER_DEFAULT(
    apns_logger, src::severity_logger_mt<trivial::severity_level>)

inline src::severity_logger_mt<trivial::severity_level> &app_logger() {
  return apns_logger::get();
}

inline trivial::severity_level parse_log_level(const std::string &level) {
  if (level == "trace") {
    return trivial::trace;
  } else if (level == "debug") {
    return trivial::debug;
  } else if (level == "warning") {
    return trivial::warning;
  } else if (level == "error") {
    return trivial::error;
  } else if (level == "fatal") {
    return trivial::fatal;
  }
  return trivial::info;
}

inline void init_my_log(const apnsclient::LoggingConfig &loggingConfig) {
  const auto format =
      "[%TimeStamp%] [%Severity%]: %Message%" /*< log record format >*/;
  if (loggingConfig.log_dir.empty()) {
    logging::add_console_log(std::clog, logging::keywords::format = format,
                             logging::keywords::auto_flush = true);
  } else {
    std::string logfile = fmt::format("{}/{}_%N.log", loggingConfig.log_dir,
                                      loggingConfig.log_file);

    auto sink = logging::add_file_log(
        logging::keywords::file_name = logfile,
        logging::keywords::rotation_size = loggingConfig.rotation_size,
        logging::keywords::format = format,
        logging::keywords::auto_flush = true,
        logging::keywords::open_mode = std::ios_base::app);
    sink->locked_backend()->set_file_collector(
        logging::sinks::file::make_collector(
            logging::keywords::target = loggingConfig.log_dir,
            logging::keywords::max_size = loggingConfig.rotation_size * 10,
            logging::keywords::max_files = 10));
    sink->locked_backend()->scan_for_files();
  }

  logging::add_common_attributes();
  logging::core::get()->set_filter(logging::trivial::severity >=
                                   parse_log_level(loggingConfig.level));
}
