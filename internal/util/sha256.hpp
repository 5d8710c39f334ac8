#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

struct evp_md_ctx_st;

namespace recsync::util {

/*
  Incremental SHA-256 over OpenSSL EVP.

  Digests are rendered as lowercase hex.
*/
class Sha256 {
 public:
  Sha256();
  ~Sha256();

  Sha256(const Sha256&)            = delete;
  Sha256& operator=(const Sha256&) = delete;

  void Update(const void* data, std::size_t size);
  void Update(std::string_view data) {
    Update(data.data(), data.size());
  }

  // Finalizes the digest; the hasher cannot be updated afterwards.
  std::string HexDigest();

 private:
  struct CtxDeleter {
    void operator()(evp_md_ctx_st* ctx) const noexcept;
  };

  std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
  bool                                       finalized_ = false;
};

std::string Sha256Hex(std::string_view data);

// Streams the whole file through the hasher. Throws std::runtime_error on I/O errors.
std::string Sha256File(const std::filesystem::path& path);

} // namespace recsync::util
