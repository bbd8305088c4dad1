#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include "store/object_id.hpp"

namespace lfs {
namespace store {

// Size of an object at the instant it was looked up
struct ObjectRecord {
  ObjectId oid;
  std::uint64_t size;
};

// Computes {root}/objects/{oid[0:2]}/{oid[2:4]}/{oid} without touching the filesystem
std::filesystem::path locate(const std::filesystem::path& root, const ObjectId& oid);

// Read-only view of an object store populated by an external writer
class ObjectStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit ObjectStore(std::filesystem::path root);


  // ---- QUERY OPERATIONS ----
  // Resolves the on-disk location of an object
  std::filesystem::path locate(const ObjectId& oid) const;
  // Stats the object, throws StoreError if it cannot be read as a regular file
  ObjectRecord stat(const ObjectId& oid) const;


  // ---- GETTERS ----
  const std::filesystem::path& root() const { return root_; }

private:
  // ---- PARAMETERS ----
  // Store root, objects live under {root_}/objects
  std::filesystem::path root_;
};

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace store
} // namespace lfs
