#pragma once

#include <boost/beast/http/file_body.hpp>
#include <boost/beast/http/status.hpp>
#include <cstdint>
#include <string>
#include <variant>

namespace lfs {
namespace network {

// Body of a response before it is bound to a connection:
//   std::monostate              - no body (every HEAD response)
//   std::string                 - JSON text
//   file_body::value_type       - open object file, streamed in chunks on write
using ResponseBody = std::variant<std::monostate,
                                  std::string,
                                  boost::beast::http::file_body::value_type>;

struct Response {
  boost::beast::http::status status;
  std::string content_type;
  // Length of the body GET would carry, also announced for HEAD
  std::uint64_t content_length;
  ResponseBody body;

  bool has_body() const { return !std::holds_alternative<std::monostate>(body); }
};

} // namespace network
} // namespace lfs
