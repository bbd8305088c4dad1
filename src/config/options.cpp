#include "config/options.hpp"
#include <limits>
#include <stdexcept>
#include <unordered_set>

namespace lfs {
namespace config {

namespace {

bool parse_number(const std::string& value, unsigned long max, unsigned long& result) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    return false;
  }
  try {
    result = std::stoul(value);
  } catch (const std::out_of_range&) {
    return false;
  }
  return result <= max;
}

} // namespace

void print_usage(const std::string& program_name, std::ostream& out) {
  out << "Usage: " << program_name << " [root] [options]\n"
      << "Start a Git LFS server serving objects from root (default ./.lfs)\n"
      << "Options:\n"
      << "  -s, --address <address>  IP address to listen on (default 127.0.0.1)\n"
      << "  -p, --port <port>        TCP port to listen on (default 8080)\n"
      << "  -t, --threads <n>        Worker threads (default 1)\n"
      << "      --log-file <path>    Write the log to a file instead of stderr\n"
      << "      --log-level <level>  trace, debug, info, warning, error or fatal (default info)\n"
      << "      --help               Show this message\n"
      << "Example: " << program_name << " /srv/lfs -s 0.0.0.0 -p 8080\n";
}

ServerOptions parse_command_line(int argc, const char* const argv[], std::ostream& err) {
  const std::unordered_set<std::string> flags_with_value = {
    "-s", "--address",
    "-p", "--port",
    "-t", "--threads",
    "--log-file",
    "--log-level"
  };

  ServerOptions options;
  const std::string program_name = argc > 0 ? argv[0] : "lfs_server";
  bool root_seen = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg(argv[i]);

    if (arg == "--help" || arg == "-h") {
      options.help = true;
      options.valid = true;
      return options;
    }

    if (flags_with_value.count(arg) == 0) {
      if (!arg.empty() && arg.front() == '-') {
        err << "Error: Unknown argument: " << arg << '\n';
        print_usage(program_name, err);
        return options;
      }
      if (root_seen) {
        err << "Error: Unexpected argument: " << arg << '\n';
        print_usage(program_name, err);
        return options;
      }
      options.root = arg;
      root_seen = true;
      continue;
    }

    if (i + 1 >= argc) {
      err << "Error: Missing value for " << arg << '\n';
      print_usage(program_name, err);
      return options;
    }
    const std::string value(argv[++i]);

    if (arg == "-s" || arg == "--address") {
      options.address = value;
    } else if (arg == "-p" || arg == "--port") {
      unsigned long port = 0;
      if (!parse_number(value, std::numeric_limits<uint16_t>::max(), port) || port == 0) {
        err << "Error: Invalid port number: " << value << '\n';
        print_usage(program_name, err);
        return options;
      }
      options.port = static_cast<uint16_t>(port);
    } else if (arg == "-t" || arg == "--threads") {
      unsigned long threads = 0;
      if (!parse_number(value, 1024, threads) || threads == 0) {
        err << "Error: Invalid thread count: " << value << '\n';
        print_usage(program_name, err);
        return options;
      }
      options.threads = static_cast<std::size_t>(threads);
    } else if (arg == "--log-file") {
      options.log_file = value;
    } else if (arg == "--log-level") {
      auto level = logging::parse_severity(value);
      if (!level) {
        err << "Error: Invalid log level: " << value << '\n';
        print_usage(program_name, err);
        return options;
      }
      options.log_level = *level;
    }
  }

  if (options.address.empty() || options.root.empty()) {
    err << "Error: Address and root must not be empty\n";
    print_usage(program_name, err);
    return options;
  }

  options.valid = true;
  return options;
}

} // namespace config
} // namespace lfs
