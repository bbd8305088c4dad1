#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include "logger/logger.hpp"

namespace lfs {
namespace config {

struct ServerOptions {
  std::string root{"./.lfs"};
  std::string address{"127.0.0.1"};
  uint16_t port{8080};
  std::size_t threads{1};
  std::string log_file;
  logging::severity_level log_level{boost::log::trivial::info};
  bool help{false};
  bool valid{false};
};

// Parses: [root] [-s|--address <address>] [-p|--port <port>] [-t|--threads <n>]
//         [--log-file <path>] [--log-level <level>] [--help]
// Problems are reported on err and leave valid == false
ServerOptions parse_command_line(int argc, const char* const argv[], std::ostream& err);

void print_usage(const std::string& program_name, std::ostream& out);

} // namespace config
} // namespace lfs
