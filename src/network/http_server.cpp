#include "network/http_server.hpp"
#include "network/http_session.hpp"

namespace lfs {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

HTTP_Server::HTTP_Server(const config::ServerOptions& options)
  : address_(options.address)
  , port_(options.port)
  , thread_count_(options.threads == 0 ? 1 : options.threads)
  , handler_(options.root, options.port)
  , is_running_(false)
  , io_context_(static_cast<int>(thread_count_)) {
  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initializing HTTP server on " << address_ << ":" << port_;
}

HTTP_Server::~HTTP_Server() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool HTTP_Server::start_listener() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP server: Server already running";
    return false;
  }

  try {
    // Create endpoint
    boost::asio::ip::tcp::endpoint endpoint(
      boost::asio::ip::make_address(address_),
      port_
    );

    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Acceptor created";
    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(io_context_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen(boost::asio::socket_base::max_listen_connections);

    // A previous shutdown leaves the io_context stopped
    io_context_.restart();
    is_running_ = true;

    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Starting to accept connections";
    start_accept();

    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Starting " << thread_count_ << " IO thread(s)";
    for (std::size_t i = 0; i < thread_count_; ++i) {
      io_threads_.emplace_back([this]() {
        boost::asio::io_context::work work(io_context_);
        // run() returns normally only once the io_context is stopped
        for (;;) {
          try {
            io_context_.run();
            break;
          } catch (const std::exception& e) {
            BOOST_LOG_TRIVIAL(error) << "HTTP server: IO context error: " << e.what();
          }
        }
      });
    }

    BOOST_LOG_TRIVIAL(info) << "HTTP server: Listening for HTTP on port " << port_;
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Failed to start server on " << address_ << ":"
                             << port_ << ": " << e.what();
    acceptor_.reset();
    return false;
  }
}

void HTTP_Server::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  // Each connection runs on its own strand so handlers of one session never overlap
  acceptor_->async_accept(boost::asio::make_strand(io_context_),
    [this](const boost::system::error_code& error, boost::asio::ip::tcp::socket socket) {
      if (!error) {
        std::make_shared<HTTP_Session>(std::move(socket), handler_)->start();
      } else if (error == boost::asio::error::operation_aborted) {
        return;
      } else {
        BOOST_LOG_TRIVIAL(error) << "HTTP server: Accept error: " << error.message();
      }
      start_accept();  // Continue accepting new connections
    });
}

void HTTP_Server::shutdown() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (!is_running_) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initiating server shutdown";

  is_running_ = false;

  // Stop accepting new connections
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "HTTP server: Error closing acceptor: " << ec.message();
    }
  }

  // Stop io_context, sessions still queued are released with it
  io_context_.stop();

  for (auto& thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();
  acceptor_.reset();

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Server shutdown complete";
}

} // namespace network
} // namespace lfs
