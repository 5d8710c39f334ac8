#include "sha256.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <stdexcept>

namespace recsync::util {

namespace {

std::string OpenSSLError(const char* operation) {
  std::string message = std::string(operation) + " failed";
  if (unsigned long code = ERR_get_error(); code != 0) {
    std::array<char, 256> buffer{};
    ERR_error_string_n(code, buffer.data(), buffer.size());
    message += ": ";
    message += buffer.data();
  }
  return message;
}

} // namespace

void Sha256::CtxDeleter::operator()(evp_md_ctx_st* ctx) const noexcept {
  EVP_MD_CTX_free(ctx);
}

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw std::runtime_error(OpenSSLError("EVP_MD_CTX_new"));
  }
  if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error(OpenSSLError("EVP_DigestInit_ex"));
  }
}

Sha256::~Sha256() = default;

void Sha256::Update(const void* data, std::size_t size) {
  if (finalized_) {
    throw std::logic_error("sha256 digest already finalized");
  }
  if (size == 0) return;
  if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
    throw std::runtime_error(OpenSSLError("EVP_DigestUpdate"));
  }
}

std::string Sha256::HexDigest() {
  if (finalized_) {
    throw std::logic_error("sha256 digest already finalized");
  }

  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int                               length = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), digest.data(), &length) != 1) {
    throw std::runtime_error(OpenSSLError("EVP_DigestFinal_ex"));
  }
  finalized_ = true;

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           result;
  result.reserve(length * 2);
  for (unsigned int i = 0; i < length; ++i) {
    result.push_back(kHex[(digest[i] >> 4) & 0x0F]);
    result.push_back(kHex[digest[i] & 0x0F]);
  }
  return result;
}

std::string Sha256Hex(std::string_view data) {
  Sha256 hasher;
  hasher.Update(data);
  return hasher.HexDigest();
}

std::string Sha256File(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot open " + path.string() + " for hashing");
  }

  Sha256                 hasher;
  std::array<char, 1 << 16> buffer{};
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const auto got = in.gcount();
    if (got > 0) {
      hasher.Update(buffer.data(), static_cast<std::size_t>(got));
    }
  }
  if (in.bad()) {
    throw std::runtime_error("read error while hashing " + path.string());
  }
  return hasher.HexDigest();
}

} // namespace recsync::util
