#include <domp/blake3/hash.hpp>
#include <domp/crypto/hash.hpp>
#include <domp/crypto/sign.hpp>
#include <domp/crypto/verify.hpp>
#include <gtest/gtest.h>

#include <string_view>

namespace {

// RFC 8032, section 7.1, TEST 1.
constexpr auto kRfcSecret = std::string_view{
    "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60"};
constexpr auto kRfcPublic = std::string_view{
    "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a"};
constexpr auto kRfcSignature = std::string_view{
    "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e06522490155"
    "5fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b"};

}  // namespace

TEST(crypto, sha256_matches_known_vector) {
  auto digest = domp::crypto::sha256(std::string_view{"abc"});
  EXPECT_EQ(domp::schema::to_hex(digest),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(crypto, blake3_matches_empty_input_vector) {
  auto digest = domp::blake3::hash(std::string_view{});
  EXPECT_EQ(domp::schema::to_hex(digest),
            "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

TEST(crypto, blake3_incremental_matches_one_shot) {
  auto state = domp::blake3::hasher{};
  state.update(std::string_view{"decentralized "});
  state.update(std::string_view{"marketplace"});
  EXPECT_EQ(state.finalize(),
            domp::blake3::hash(std::string_view{"decentralized marketplace"}));
}

TEST(crypto, ed25519_keypair_and_signature_match_rfc_8032) {
  if (!domp::crypto::available()) {
    GTEST_SKIP() << "Ed25519 is unavailable in linked OpenSSL";
  }
  auto secret = domp::schema::try_make_hash32(kRfcSecret);
  ASSERT_TRUE(secret.has_value());
  auto keys = domp::crypto::keypair_from_secret(*secret);
  ASSERT_TRUE(keys.has_value());
  EXPECT_EQ(domp::schema::to_hex(keys->public_key), kRfcPublic);

  auto signature =
      domp::crypto::sign(domp::schema::bytes_view_t{}, keys->secret_key);
  ASSERT_TRUE(signature.has_value());
  EXPECT_EQ(domp::schema::to_hex(*signature), kRfcSignature);
  EXPECT_TRUE(domp::crypto::verify_signature(domp::schema::bytes_view_t{},
                                             keys->public_key, *signature));
}

TEST(crypto, ed25519_rejects_tampered_message_and_foreign_key) {
  if (!domp::crypto::available()) {
    GTEST_SKIP() << "Ed25519 is unavailable in linked OpenSSL";
  }
  auto keys = domp::crypto::generate_keypair();
  auto other = domp::crypto::generate_keypair();
  ASSERT_TRUE(keys.has_value());
  ASSERT_TRUE(other.has_value());

  auto message = domp::schema::bytes_t{0x01, 0x02, 0x03};
  auto signature = domp::crypto::sign(
      domp::schema::make_bytes_view(message), keys->secret_key);
  ASSERT_TRUE(signature.has_value());
  EXPECT_TRUE(domp::crypto::verify_signature(
      domp::schema::make_bytes_view(message), keys->public_key, *signature));

  EXPECT_FALSE(domp::crypto::verify_signature(
      domp::schema::make_bytes_view(message), other->public_key, *signature));
  message[1] ^= 0x01;
  EXPECT_FALSE(domp::crypto::verify_signature(
      domp::schema::make_bytes_view(message), keys->public_key, *signature));
}

TEST(crypto, random_array_fills_every_call_differently) {
  auto first = domp::crypto::random_array<32>();
  auto second = domp::crypto::random_array<32>();
  EXPECT_NE(first, second);
}
