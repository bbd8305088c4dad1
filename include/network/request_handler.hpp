#pragma once

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/verb.hpp>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include "network/request_error.hpp"
#include "network/response.hpp"
#include "network/router.hpp"
#include "store/store.hpp"

namespace lfs {
namespace network {

// Turns one request into a Response. Holds no per-request state and may be
// shared by every session of the server.
class RequestHandler {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // port is the port the server listens on, used when building absolute links
  RequestHandler(const std::filesystem::path& root, std::uint16_t port);


  // ---- REQUEST PROCESSING ----
  Response handle(boost::beast::http::verb method,
                  std::string_view target,
                  std::string_view host_header) const;

  template <class Body, class Fields>
  Response handle(const boost::beast::http::request<Body, Fields>& request) const {
    auto target = request.target();
    auto host = request[boost::beast::http::field::host];
    return handle(request.method(),
                  std::string_view(target.data(), target.size()),
                  std::string_view(host.data(), host.size()));
  }


  // ---- GETTERS ----
  const store::ObjectStore& get_store() const { return store_; }
  std::uint16_t port() const { return port_; }

private:
  // ---- PARAMETERS ----
  store::ObjectStore store_;
  std::uint16_t port_;


  // ---- RESPONSE BUILDERS ----
  // Stats the object and renders its JSON descriptor
  Response respond_metadata(const Route& route, const std::string& host, bool head_only) const;
  // Opens the object file; GET streams it, HEAD closes it right away
  Response respond_object(const Route& route, bool head_only) const;
  // JSON error envelope with the status mapped from the error
  Response respond_error(RequestError error, bool head_only) const;
  Response respond_json(boost::beast::http::status status, std::string text, bool head_only) const;
};

} // namespace network
} // namespace lfs
