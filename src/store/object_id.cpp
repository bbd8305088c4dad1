#include "store/object_id.hpp"
#include <algorithm>

namespace lfs {
namespace store {

namespace {

// Only lowercase digits: the digest is always rendered in lowercase
bool is_hex_digit(char c) {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

} // namespace

bool ObjectId::is_valid(std::string_view candidate) {
  if (candidate.size() != LENGTH) {
    return false;
  }
  return std::all_of(candidate.begin(), candidate.end(), is_hex_digit);
}

std::optional<ObjectId> ObjectId::parse(std::string_view candidate) {
  if (!is_valid(candidate)) {
    return std::nullopt;
  }
  return ObjectId(std::string(candidate));
}

} // namespace store
} // namespace lfs
