#pragma once

#include <cstdint>
#include <string>
#include "store/object_id.hpp"

namespace lfs {
namespace protocol {

inline constexpr std::uint16_t DEFAULT_HTTP_PORT = 80;

struct Links {
  std::string self_url;
  std::string download_url;
};

// "http://{host}[:{port}]" with the port left out when it is the default one
std::string base_url(const std::string& host, std::uint16_t port);

// self: {base}/objects/{oid}, download: {base}/data/objects/{oid}
Links make_links(const std::string& host, std::uint16_t port, const store::ObjectId& oid);

} // namespace protocol
} // namespace lfs
