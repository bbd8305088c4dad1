#include "protocol/json.hpp"
#include <nlohmann/json.hpp>

namespace lfs {
namespace protocol {
namespace json {

namespace {
constexpr int INDENT = 2;

// Invalid UTF-8 is replaced instead of thrown
std::string dump(const nlohmann::json& body) {
  return body.dump(INDENT, ' ', false, nlohmann::json::error_handler_t::replace);
}
}

std::string render_error(const std::string& message) {
  nlohmann::json body = {
    {"message", message}
  };
  return dump(body);
}

std::string render_metadata(const std::string& oid, std::uint64_t size,
                            const std::string& self_url, const std::string& download_url) {
  nlohmann::json body;
  body["oid"] = oid;
  body["size"] = size;
  body["_links"] = {
    {"self", {{"href", self_url}}},
    {"download", {{"href", download_url}}}
  };
  return dump(body);
}

} // namespace json
} // namespace protocol
} // namespace lfs
