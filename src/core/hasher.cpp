#include "core/hasher.hpp"
#include "json_min.h"
#include <openssl/err.h>
#include <openssl/evp.h>

namespace gup {

static std::string opensslError(const char* where){
  unsigned long code = ERR_get_error();
  char buf[256] = {0};
  if (code) ERR_error_string_n(code, buf, sizeof(buf));
  return std::string(where) + (code ? std::string(": ") + buf : std::string());
}

Sha256Hasher::Sha256Hasher() {
  ctx_ = EVP_MD_CTX_new();
  if (!ctx_) { err_ = opensslError("EVP_MD_CTX_new"); return; }
  if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1)
    err_ = opensslError("EVP_DigestInit_ex");
}

Sha256Hasher::~Sha256Hasher() {
  if (ctx_) EVP_MD_CTX_free(ctx_);
}

bool Sha256Hasher::update(const uint8_t* data, size_t len) {
  if (!ok() || finished_) return false;
  if (len == 0) return true;
  if (EVP_DigestUpdate(ctx_, data, len) != 1) {
    err_ = opensslError("EVP_DigestUpdate");
    return false;
  }
  total_ += len;
  return true;
}

bool Sha256Hasher::finish(std::string& hexOut, std::string& err) {
  if (!ok()) { err = err_.empty() ? "hasher not initialised" : err_; return false; }
  if (finished_) { err = "digest already finalised"; return false; }
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int mdLen = 0;
  if (EVP_DigestFinal_ex(ctx_, md, &mdLen) != 1) {
    err_ = opensslError("EVP_DigestFinal_ex");
    err = err_;
    return false;
  }
  finished_ = true;
  hexOut = hexLower(md, mdLen);
  return true;
}

} // namespace gup
