#include "store/store.hpp"
#include <boost/log/trivial.hpp>
#include <system_error>

namespace lfs {
namespace store {

namespace {
const char* const OBJECTS_DIR = "objects";
}

std::filesystem::path locate(const std::filesystem::path& root, const ObjectId& oid) {
  std::filesystem::path path = root / OBJECTS_DIR;
  path /= std::string(oid.first_shard());
  path /= std::string(oid.second_shard());
  path /= oid.str();
  return path;
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ObjectStore::ObjectStore(std::filesystem::path root) : root_(std::move(root)) {
  BOOST_LOG_TRIVIAL(info) << "Store: Serving objects from: " << (root_ / OBJECTS_DIR).string();
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::filesystem::path ObjectStore::locate(const ObjectId& oid) const {
  std::filesystem::path path = store::locate(root_, oid);
  BOOST_LOG_TRIVIAL(trace) << "Store: Calculated path: " << path.string();
  return path;
}

ObjectRecord ObjectStore::stat(const ObjectId& oid) const {
  std::filesystem::path file_path = locate(oid);

  std::error_code ec;
  std::filesystem::file_status status = std::filesystem::status(file_path, ec);
  if (ec || !std::filesystem::is_regular_file(status)) {
    BOOST_LOG_TRIVIAL(debug) << "Store: Object not found: " << file_path.string()
                             << (ec ? " (" + ec.message() + ")" : "");
    throw StoreError("Store: Object not found: " + oid.str());
  }

  std::uintmax_t size = std::filesystem::file_size(file_path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(debug) << "Store: Failed to read size of " << file_path.string()
                             << ": " << ec.message();
    throw StoreError("Store: Failed to read object size: " + oid.str());
  }

  BOOST_LOG_TRIVIAL(debug) << "Store: Object " << oid << " is " << size << " bytes";
  return ObjectRecord{oid, static_cast<std::uint64_t>(size)};
}

} // namespace store
} // namespace lfs
