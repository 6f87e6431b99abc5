#include "margin_core/util/hashing.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <memory>
#include <sstream>

namespace margin_core {

std::string sha256_hex(const std::string& content) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> mdctx(EVP_MD_CTX_new(),
                                                                 &EVP_MD_CTX_free);
  if (!mdctx) {
    throw HashingError("Failed to create EVP context for hashing");
  }

  if (EVP_DigestInit_ex(mdctx.get(), EVP_sha256(), nullptr) != 1) {
    throw HashingError("Failed to initialize SHA256 digest");
  }
  if (EVP_DigestUpdate(mdctx.get(), content.data(), content.length()) != 1) {
    throw HashingError("Failed to update SHA256 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (EVP_DigestFinal_ex(mdctx.get(), hash, &hash_len) != 1) {
    throw HashingError("Failed to finalize SHA256 digest");
  }

  std::ostringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

}  // namespace margin_core
