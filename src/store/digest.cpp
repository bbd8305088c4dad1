#include "store/digest.hpp"
#include "store/store.hpp"
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>
#include <iomanip>
#include <sstream>

namespace lfs {
namespace store {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

namespace {

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw StoreError("Store: Failed to create hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

  EVP_MD_CTX* get() { return ctx; }
};

} // namespace


//==============================================
// HASHING
//==============================================

std::string sha256_hex(std::istream& input) {
  DigestContext context;

  if (!EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr)) {
    throw StoreError("Store: Failed to initialize hash context");
  }

  char buffer[8192];
  std::size_t total_bytes = 0;

  // Feed the stream in chunks so arbitrarily large objects can be hashed
  while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
    if (!EVP_DigestUpdate(context.get(), buffer, static_cast<std::size_t>(input.gcount()))) {
      throw StoreError("Store: Failed to update hash");
    }
    total_bytes += static_cast<std::size_t>(input.gcount());
  }

  if (input.bad()) {
    throw StoreError("Store: Failed to read input stream");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (!EVP_DigestFinal_ex(context.get(), hash, &hash_len)) {
    throw StoreError("Store: Failed to finalize hash");
  }

  // Convert the raw hash bytes to a hexadecimal string
  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(hash[i]);
  }

  std::string result = ss.str();
  BOOST_LOG_TRIVIAL(debug) << "Store: Hashed " << total_bytes << " bytes to " << result;
  return result;
}

} // namespace store
} // namespace lfs
