#pragma once

#include "network/request_handler.hpp"
#include "network/response.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <memory>
#include <string>

namespace lfs {
namespace network {

// One accepted connection serving requests one after another until the
// client closes it or asks for close
class HTTP_Session : public std::enable_shared_from_this<HTTP_Session> {
public:
  HTTP_Session(boost::asio::ip::tcp::socket&& socket, const RequestHandler& handler);
  ~HTTP_Session();

  void start();

private:
  void do_read();
  void on_read(boost::beast::error_code ec, std::size_t bytes_transferred);
  void send_response(Response response);
  template <class Body>
  void write(boost::beast::http::response<Body>&& response);
  void on_write(bool close, boost::beast::error_code ec, std::size_t bytes_transferred);
  void do_close();

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> request_;
  // Response being written, kept alive until the write completes
  std::shared_ptr<void> response_;
  const RequestHandler& handler_;
  std::string remote_;
};

} // namespace network
} // namespace lfs
