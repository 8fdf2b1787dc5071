/**
 * @file fingerprint.cpp
 * @brief SHA-256 path fingerprints via OpenSSL EVP
 */

#include "vconv/fingerprint.hpp"

#include <filesystem>
#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace vconv {

namespace fs = std::filesystem;

std::string canonical_path(const std::string &path) {
  std::string out = fs::path(path).lexically_normal().string();
  /// "/videos/" and "/videos" name the same directory
  while (out.size() > 1 && out.back() == '/')
    out.pop_back();
  return out;
}

std::string fingerprint_of(const std::string &path) {
  const std::string canon = canonical_path(path);

  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(
      EVP_MD_CTX_new(), EVP_MD_CTX_free);
  if (!ctx)
    throw std::runtime_error("EVP_MD_CTX_new failed");

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), canon.data(), canon.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
    throw std::runtime_error("SHA-256 digest failed");
  }

  static const char hex[] = "0123456789abcdef";
  std::string out;
  out.reserve(digest_len * 2);
  for (unsigned int i = 0; i < digest_len; ++i) {
    out += hex[digest[i] >> 4];
    out += hex[digest[i] & 0x0f];
  }
  return out;
}

bool is_valid_fingerprint(const std::string &s) {
  if (s.size() != FINGERPRINT_LENGTH)
    return false;
  for (char c : s) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')))
      return false;
  }
  return true;
}

} // namespace vconv
