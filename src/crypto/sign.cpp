#include <domp/crypto/hash.hpp>
#include <domp/crypto/sign.hpp>

#include <openssl/evp.h>

#include <memory>

namespace domp::crypto {

namespace {

using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

evp_pkey_ptr make_private_key(const domp::schema::secret_key_t& secret_key) {
  return evp_pkey_ptr{
      EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                   secret_key.data(), secret_key.size()),
      EVP_PKEY_free};
}

}  // namespace

std::optional<keypair_t> generate_keypair() {
  return keypair_from_secret(random_array<32>());
}

std::optional<keypair_t> keypair_from_secret(
    const domp::schema::secret_key_t& secret_key) {
  auto pkey = make_private_key(secret_key);
  if (!pkey) {
    return std::nullopt;
  }
  auto keypair = keypair_t{.secret_key = secret_key};
  auto length = keypair.public_key.size();
  if (EVP_PKEY_get_raw_public_key(pkey.get(), keypair.public_key.data(),
                                  &length) != 1 ||
      length != keypair.public_key.size()) {
    return std::nullopt;
  }
  return keypair;
}

std::optional<domp::schema::signature_t> sign(
    const domp::schema::bytes_view_t& message,
    const domp::schema::secret_key_t& secret_key) {
  auto pkey = make_private_key(secret_key);
  if (!pkey) {
    return std::nullopt;
  }
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return std::nullopt;
  }
  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) !=
      1) {
    return std::nullopt;
  }
  auto signature = domp::schema::signature_t{};
  auto length = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &length, message.data(),
                     message.size()) != 1 ||
      length != signature.size()) {
    return std::nullopt;
  }
  return signature;
}

}  // namespace domp::crypto
