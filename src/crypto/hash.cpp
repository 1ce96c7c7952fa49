#include <domp/common/critical.hpp>
#include <domp/crypto/hash.hpp>

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <memory>

namespace domp::crypto {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

}  // namespace

domp::schema::hash32_t sha256(const domp::schema::bytes_view_t& bytes) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    domp::common::critical("failed to allocate SHA-256 context");
  }
  auto output = domp::schema::hash32_t{};
  auto length = 0u;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), output.data(), &length) != 1 ||
      length != output.size()) {
    domp::common::critical("SHA-256 digest failed");
  }
  return output;
}

domp::schema::hash32_t sha256(const std::string_view& str) {
  return sha256(domp::schema::make_bytes_view(str));
}

void random_bytes(std::span<uint8_t> out) {
  if (out.empty()) {
    return;
  }
  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    domp::common::critical("OpenSSL RAND_bytes failed");
  }
}

}  // namespace domp::crypto
