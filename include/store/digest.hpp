#pragma once

#include <istream>
#include <string>

namespace lfs {
namespace store {

// Hex-encoded SHA-256 of the remaining bytes of input, computed with OpenSSL EVP.
// The result is a valid ObjectId for content stored under it. Throws StoreError.
std::string sha256_hex(std::istream& input);

} // namespace store
} // namespace lfs
