#include "conj_cache/digest.hpp"

#include "conj_cache/log.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

namespace conj_cache {

std::string encode_args(const std::vector<std::string> &args) {
  std::string out;
  for (const auto &a : args) {
    out += std::to_string(a.size());
    out += ':';
    out += a;
  }
  return out;
}

std::optional<std::string> digest_key(const std::vector<std::string> &args) {
  const std::string data = encode_args(args);
  unsigned char hash[SHA256_DIGEST_LENGTH];
  unsigned int len = 0;

  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (!ctx) {
    CONJ_LOG_WARN("cannot create EVP_MD_CTX, cache key unavailable");
    return std::nullopt;
  }
  const bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
                  EVP_DigestUpdate(ctx, data.data(), data.size()) == 1 &&
                  EVP_DigestFinal_ex(ctx, hash, &len) == 1;
  EVP_MD_CTX_free(ctx);
  if (!ok) {
    CONJ_LOG_WARN("SHA-256 digest failed, cache key unavailable");
    return std::nullopt;
  }

  std::ostringstream result;
  for (unsigned int i = 0; i < len; ++i)
    result << std::hex << std::setw(2) << std::setfill('0')
           << static_cast<int>(hash[i]);
  return result.str();
}

} // namespace conj_cache
