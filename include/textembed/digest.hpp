#pragma once

#include <textembed/status.hpp>

#include <openssl/evp.h>

#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace textembed::internal {

// Incremental SHA-256 over OpenSSL's EVP digest API.
class Sha256 {
 public:
  static constexpr size_t kDigestBytes = 32;

  Sha256() : ctx_(EVP_MD_CTX_new()) {
    ok_ = ctx_ != nullptr &&
          EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) == 1;
  }

  void Update(std::string_view data) {
    if (ok_ && !data.empty()) {
      ok_ = EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) == 1;
    }
  }

  /**
   * Finishes the digest and returns it as lowercase hex.
   * Returns an empty string if OpenSSL reported a failure; the object
   * cannot be updated afterwards.
   */
  std::string HexDigest() {
    std::array<uint8_t, kDigestBytes> digest{};
    unsigned int len = 0;
    if (!ok_ || EVP_DigestFinal_ex(ctx_.get(), digest.data(), &len) != 1 ||
        len != kDigestBytes) {
      ok_ = false;
      return std::string();
    }
    ok_ = false;

    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(kDigestBytes * 2);
    for (uint8_t b : digest) {
      out.push_back(kHex[b >> 4]);
      out.push_back(kHex[b & 0x0F]);
    }
    return out;
  }

  static std::string Hex(std::string_view data) {
    Sha256 sha;
    sha.Update(data);
    return sha.HexDigest();
  }

 private:
  struct CtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
  };

  std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
  bool ok_ = false;
};

/** Feeds the contents of `path` into `sha` in fixed-size reads. */
inline Status HashFile(const std::filesystem::path& path, Sha256* sha,
                       uint64_t* size) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return Status::IOError("Cannot open " + path.string() + " for reading");
  }
  std::vector<char> buf(1 << 20);
  uint64_t total = 0;
  while (file) {
    file.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    std::streamsize n = file.gcount();
    if (n <= 0) break;
    sha->Update(std::string_view(buf.data(), static_cast<size_t>(n)));
    total += static_cast<uint64_t>(n);
  }
  if (file.bad()) {
    return Status::IOError("Failed to read " + path.string());
  }
  *size = total;
  return Status::OK();
}

}  // namespace textembed::internal
