#include "network/http_session.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/log/trivial.hpp>
#include <chrono>
#include <exception>
#include <tuple>

namespace lfs {
namespace network {

namespace beast = boost::beast;
namespace http = boost::beast::http;

namespace {
// Idle time allowed between two requests of a keep-alive connection
constexpr std::chrono::seconds READ_TIMEOUT{30};
}

HTTP_Session::HTTP_Session(boost::asio::ip::tcp::socket&& socket, const RequestHandler& handler)
  : stream_(std::move(socket))
  , handler_(handler) {
  beast::error_code ec;
  auto endpoint = stream_.socket().remote_endpoint(ec);
  remote_ = ec ? std::string("unknown")
               : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
  BOOST_LOG_TRIVIAL(debug) << "HTTP session: Accepted connection from " << remote_;
}

HTTP_Session::~HTTP_Session() {
  BOOST_LOG_TRIVIAL(debug) << "HTTP session: Connection from " << remote_ << " released";
}

void HTTP_Session::start() {
  // Run the first read on the session's strand
  boost::asio::dispatch(stream_.get_executor(),
                        beast::bind_front_handler(&HTTP_Session::do_read, shared_from_this()));
}


//==============================================
// READING REQUESTS
//==============================================

void HTTP_Session::do_read() {
  request_ = {};
  stream_.expires_after(READ_TIMEOUT);
  http::async_read(stream_, buffer_, request_,
                   beast::bind_front_handler(&HTTP_Session::on_read, shared_from_this()));
}

void HTTP_Session::on_read(beast::error_code ec, std::size_t) {
  if (ec == http::error::end_of_stream) {
    return do_close();
  }
  if (ec == beast::error::timeout) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP session: Idle timeout for " << remote_;
    return;
  }
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP session: Failed to read request from " << remote_
                               << ": " << ec.message();
    return;
  }

  Response response;
  try {
    response = handler_.handle(request_);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP session: Failed to handle " << request_.method_string()
                             << " " << request_.target() << " from " << remote_ << ": " << e.what();
    return do_close();
  }
  BOOST_LOG_TRIVIAL(info) << "HTTP session: " << remote_ << " " << request_.method_string()
                          << " " << request_.target() << " -> "
                          << static_cast<unsigned>(response.status);
  send_response(std::move(response));
}


//==============================================
// WRITING RESPONSES
//==============================================

template <class Body>
void HTTP_Session::write(http::response<Body>&& response) {
  auto sp = std::make_shared<http::response<Body>>(std::move(response));
  response_ = sp;

  // Object transfers are not bounded by the read timeout
  stream_.expires_never();
  http::async_write(stream_, *sp,
                    beast::bind_front_handler(&HTTP_Session::on_write, shared_from_this(),
                                              sp->need_eof()));
}

void HTTP_Session::send_response(Response response) {
  const unsigned version = request_.version();
  const bool keep_alive = request_.keep_alive();

  if (auto* text = std::get_if<std::string>(&response.body)) {
    http::response<http::string_body> res{response.status, version};
    res.set(http::field::content_type, response.content_type);
    res.body() = std::move(*text);
    res.content_length(response.content_length);
    res.keep_alive(keep_alive);
    return write(std::move(res));
  }

  if (auto* file = std::get_if<http::file_body::value_type>(&response.body)) {
    http::response<http::file_body> res{
      std::piecewise_construct,
      std::make_tuple(std::move(*file)),
      std::make_tuple(response.status, version)};
    res.set(http::field::content_type, response.content_type);
    res.content_length(response.content_length);
    res.keep_alive(keep_alive);
    return write(std::move(res));
  }

  // Empty body, headers still announce what GET would have sent
  http::response<http::empty_body> res{response.status, version};
  res.set(http::field::content_type, response.content_type);
  res.content_length(response.content_length);
  res.keep_alive(keep_alive);
  write(std::move(res));
}

void HTTP_Session::on_write(bool close, beast::error_code ec, std::size_t bytes_transferred) {
  // Releases the file handle of a streamed object
  response_.reset();

  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP session: Failed to write response to " << remote_
                               << ": " << ec.message();
    return;
  }
  BOOST_LOG_TRIVIAL(debug) << "HTTP session: Wrote " << bytes_transferred << " bytes to " << remote_;

  if (close) {
    return do_close();
  }
  do_read();
}

void HTTP_Session::do_close() {
  beast::error_code ec;
  stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  if (ec && ec != beast::errc::not_connected) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP session: Shutdown of " << remote_ << " failed: " << ec.message();
  }
}

} // namespace network
} // namespace lfs
