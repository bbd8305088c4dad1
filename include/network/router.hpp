#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include "store/object_id.hpp"

namespace lfs {
namespace network {

enum class Intent {
  Metadata,   // GET/HEAD /objects/{oid}
  RawObject   // GET/HEAD /data/objects/{oid}
};

struct Route {
  store::ObjectId oid;
  Intent intent;
};

std::ostream& operator<<(std::ostream& os, Intent intent);

namespace router {

// ---- PATH CLASSIFICATION ----
// Splits path on its last '/': "/objects" yields Metadata, "/data/objects" yields RawObject,
// and the remainder must be a valid object id
std::optional<Route> route(std::string_view path);


// ---- REQUEST TARGET PARSING ----
// Host of the request: taken from an absolute-form target ("http://host:port/..."),
// otherwise from the Host header. The port is stripped. Empty when neither carries one
// or when the host holds characters a URI host cannot contain.
std::optional<std::string> extract_host(std::string_view target, std::string_view host_header);
// Path of an origin-form or absolute-form target, without query or fragment
std::string extract_path(std::string_view target);

} // namespace router
} // namespace network
} // namespace lfs
