#pragma once

#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "config/options.hpp"
#include "network/request_handler.hpp"

namespace lfs {
namespace network {

class HTTP_Server {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit HTTP_Server(const config::ServerOptions& options);
  ~HTTP_Server();

  HTTP_Server(const HTTP_Server&) = delete;
  HTTP_Server& operator=(const HTTP_Server&) = delete;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Binds the listening socket and starts the worker threads.
  // Returns false if the server is already running or the address cannot be bound.
  bool start_listener();
  void shutdown();


  // ---- GETTERS ----
  bool is_running() const { return is_running_; }
  const RequestHandler& get_handler() const { return handler_; }

private:

  // ---- PARAMETERS ----
  // Network parameters
  const std::string address_;
  const uint16_t port_;
  const std::size_t thread_count_;

  // Shared by every session, outlives the io_context
  const RequestHandler handler_;

  // Server state
  std::atomic<bool> is_running_;
  std::mutex state_mutex_;
  std::vector<std::thread> io_threads_;

  // Incoming connection handlers
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Main listening loop, each accepted socket gets its own strand and session
  void start_accept();
};

} // namespace network
} // namespace lfs
