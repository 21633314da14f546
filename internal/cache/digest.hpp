#pragma once

#include <openssl/evp.h>

#include <memory>
#include <string>
#include <string_view>

namespace catalog::cache {

struct EvpMdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    if (ctx) EVP_MD_CTX_free(ctx);
  }
};

/*
  Incremental SHA-256.

  Field() length-prefixes its input so adjacent fields cannot run into
  each other.
*/
class Sha256 {
 public:
  Sha256();

  void Update(std::string_view bytes);
  void Field(std::string_view bytes);

  // lowercase hex; the hasher is spent afterwards
  std::string HexDigest();

 private:
  std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx_;
};

} // namespace catalog::cache
