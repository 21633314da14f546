#include "internal/cache/digest.hpp"

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace catalog::cache {

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw std::runtime_error("openssl: failed to allocate digest context");
  }
  if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("openssl: failed to initialize sha256");
  }
}

void Sha256::Update(std::string_view bytes) {
  if (EVP_DigestUpdate(ctx_.get(), bytes.data(), bytes.size()) != 1) {
    throw std::runtime_error("openssl: digest update failed");
  }
}

void Sha256::Field(std::string_view bytes) {
  unsigned char prefix[8];
  uint64_t      size = bytes.size();
  for (int i = 7; i >= 0; --i) {
    prefix[i] = static_cast<unsigned char>(size & 0xff);
    size >>= 8;
  }
  Update(std::string_view(reinterpret_cast<const char*>(prefix), sizeof(prefix)));
  Update(bytes);
}

std::string Sha256::HexDigest() {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int  hash_len = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), hash, &hash_len) != 1) {
    throw std::runtime_error("openssl: digest final failed");
  }

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; ++i) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

} // namespace catalog::cache
