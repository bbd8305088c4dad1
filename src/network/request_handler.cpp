#include "network/request_handler.hpp"
#include "protocol/json.hpp"
#include "protocol/links.hpp"
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/file_base.hpp>
#include <boost/log/trivial.hpp>
#include <system_error>

namespace lfs {
namespace network {

namespace http = boost::beast::http;

namespace {
const char* const OCTET_STREAM_MEDIA_TYPE = "application/octet-stream";
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

RequestHandler::RequestHandler(const std::filesystem::path& root, std::uint16_t port)
  : store_(root)
  , port_(port) {
  BOOST_LOG_TRIVIAL(debug) << "Request handler: Object links will use port " << port_;
}


//==============================================
// REQUEST PROCESSING
//==============================================

Response RequestHandler::handle(http::verb method,
                                std::string_view target,
                                std::string_view host_header) const {
  const bool head_only = method == http::verb::head;

  std::optional<std::string> host = router::extract_host(target, host_header);
  if (!host) {
    BOOST_LOG_TRIVIAL(debug) << "Request handler: No host for target " << target;
    return respond_error(RequestError::MALFORMED_REQUEST, head_only);
  }

  std::optional<Route> route = router::route(router::extract_path(target));

  if (method != http::verb::get && method != http::verb::head) {
    return respond_error(RequestError::UNSUPPORTED_OPERATION, head_only);
  }

  if (!route) {
    return respond_error(RequestError::ROUTE_NOT_FOUND, head_only);
  }

  BOOST_LOG_TRIVIAL(debug) << "Request handler: " << route->intent << " request for " << route->oid;

  switch (route->intent) {
    case Intent::Metadata:
      return respond_metadata(*route, *host, head_only);
    case Intent::RawObject:
      return respond_object(*route, head_only);
  }
  return respond_error(RequestError::ROUTE_NOT_FOUND, head_only);
}


//==============================================
// RESPONSE BUILDERS
//==============================================

Response RequestHandler::respond_metadata(const Route& route, const std::string& host,
                                          bool head_only) const {
  store::ObjectRecord record{route.oid, 0};
  try {
    record = store_.stat(route.oid);
  } catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(debug) << "Request handler: " << e.what();
    return respond_error(RequestError::OBJECT_NOT_FOUND, head_only);
  }

  protocol::Links links = protocol::make_links(host, port_, record.oid);
  return respond_json(http::status::ok,
                      protocol::json::render_metadata(record.oid.str(), record.size,
                                                      links.self_url, links.download_url),
                      head_only);
}

Response RequestHandler::respond_object(const Route& route, bool head_only) const {
  const std::filesystem::path file_path = store_.locate(route.oid);

  // A directory would open fine and only fail once streaming starts
  std::error_code status_ec;
  if (!std::filesystem::is_regular_file(file_path, status_ec)) {
    BOOST_LOG_TRIVIAL(debug) << "Request handler: Not a readable object: " << file_path.string();
    return respond_error(RequestError::OBJECT_NOT_FOUND, head_only);
  }

  boost::beast::error_code ec;
  http::file_body::value_type file;
  file.open(file_path.c_str(), boost::beast::file_mode::scan, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(debug) << "Request handler: Failed to open " << file_path.string()
                             << ": " << ec.message();
    return respond_error(RequestError::OBJECT_NOT_FOUND, head_only);
  }

  const std::uint64_t size = file.size();
  if (head_only) {
    file.close();
    return Response{http::status::ok, OCTET_STREAM_MEDIA_TYPE, size, std::monostate{}};
  }
  return Response{http::status::ok, OCTET_STREAM_MEDIA_TYPE, size, std::move(file)};
}

Response RequestHandler::respond_error(RequestError error, bool head_only) const {
  return respond_json(request_error_status(error),
                      protocol::json::render_error(request_error_to_string(error)),
                      head_only);
}

Response RequestHandler::respond_json(http::status status, std::string text, bool head_only) const {
  const std::uint64_t length = text.size();
  if (head_only) {
    return Response{status, protocol::LFS_JSON_MEDIA_TYPE, length, std::monostate{}};
  }
  return Response{status, protocol::LFS_JSON_MEDIA_TYPE, length, std::move(text)};
}

} // namespace network
} // namespace lfs
