#pragma once

#include <cstdint>
#include <string>

namespace lfs {
namespace protocol {

// Media type of every JSON document the server emits
inline constexpr const char* LFS_JSON_MEDIA_TYPE = "application/vnd.git-lfs+json";

namespace json {

// {"message": <message>}
std::string render_error(const std::string& message);

// {"oid": .., "size": .., "_links": {"self": {"href": ..}, "download": {"href": ..}}}
// size is written as a JSON integer over the full 64-bit range
std::string render_metadata(const std::string& oid, std::uint64_t size,
                            const std::string& self_url, const std::string& download_url);

} // namespace json
} // namespace protocol
} // namespace lfs
