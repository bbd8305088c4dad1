#include "config/options.hpp"
#include "logger/logger.hpp"
#include "network/http_server.hpp"
#include <boost/asio/signal_set.hpp>
#include <boost/log/trivial.hpp>
#include <csignal>
#include <iostream>

bool run_server(const lfs::config::ServerOptions& options) {
  try {
    lfs::network::HTTP_Server server(options);

    if (!server.start_listener()) {
      std::cerr << "Error: Failed to listen on " << options.address << ":" << options.port << '\n';
      return false;
    }

    // Block until SIGINT or SIGTERM
    boost::asio::io_context signal_context;
    boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([&server](const boost::system::error_code& error, int signal_number) {
      if (!error) {
        BOOST_LOG_TRIVIAL(info) << "Received signal " << signal_number << ", shutting down";
      }
      server.shutdown();
    });
    signal_context.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start server: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  const auto options = lfs::config::parse_command_line(argc, argv, std::cerr);
  if (!options.valid) {
    return 1;
  }
  if (options.help) {
    lfs::config::print_usage(argv[0], std::cout);
    return 0;
  }

  try {
    lfs::logging::init_logging(options.log_file, options.log_level);
  } catch (const std::exception&) {
    return 1;
  }

  if (!run_server(options)) {
    return 1;
  }
  return 0;
}
