#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace lfs {
namespace store {

// SHA-256 content hash naming an immutable object, 64 lowercase hex digits
class ObjectId {
public:
  static constexpr std::size_t LENGTH = 64;

  // True iff candidate is exactly 64 characters of [0-9a-f]
  static bool is_valid(std::string_view candidate);
  static std::optional<ObjectId> parse(std::string_view candidate);

  const std::string& str() const { return value_; }

  // Two-level shard directories: oid[0:2] and oid[2:4]
  std::string_view first_shard() const { return std::string_view(value_).substr(0, 2); }
  std::string_view second_shard() const { return std::string_view(value_).substr(2, 2); }

  bool operator==(const ObjectId& other) const { return value_ == other.value_; }
  bool operator!=(const ObjectId& other) const { return value_ != other.value_; }

private:
  explicit ObjectId(std::string value) : value_(std::move(value)) {}

  std::string value_;
};

inline std::ostream& operator<<(std::ostream& os, const ObjectId& oid) {
  return os << oid.str();
}

} // namespace store
} // namespace lfs
