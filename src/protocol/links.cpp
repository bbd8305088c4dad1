#include "protocol/links.hpp"

namespace lfs {
namespace protocol {

std::string base_url(const std::string& host, std::uint16_t port) {
  std::string url = "http://" + host;
  if (port != DEFAULT_HTTP_PORT) {
    url += ":" + std::to_string(port);
  }
  return url;
}

Links make_links(const std::string& host, std::uint16_t port, const store::ObjectId& oid) {
  const std::string base = base_url(host, port);
  return Links{
    base + "/objects/" + oid.str(),
    base + "/data/objects/" + oid.str()
  };
}

} // namespace protocol
} // namespace lfs
