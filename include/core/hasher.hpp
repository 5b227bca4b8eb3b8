#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace gup {

// Incremental SHA-256 over a byte stream. Not copyable; one digest per instance.
class Sha256Hasher {
public:
  Sha256Hasher();
  ~Sha256Hasher();
  Sha256Hasher(const Sha256Hasher&) = delete;
  Sha256Hasher& operator=(const Sha256Hasher&) = delete;

  bool ok() const { return ctx_ != nullptr && err_.empty(); }
  const std::string& error() const { return err_; }

  bool update(const uint8_t* data, size_t len);
  // Lower-case hex digest. Fails if any update failed or finish was already called.
  bool finish(std::string& hexOut, std::string& err);

  uint64_t bytesHashed() const { return total_; }

private:
  EVP_MD_CTX* ctx_ = nullptr;
  std::string err_;
  uint64_t total_ = 0;
  bool finished_ = false;
};

} // namespace gup
