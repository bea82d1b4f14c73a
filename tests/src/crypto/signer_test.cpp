#include <gtest/gtest.h>
#include <glyphchain/crypto/signer.hpp>
#include <glyphchain/crypto/verify.hpp>
#include <glyphchain/testing/common.hpp>

#include <string>

TEST(crypto_signer, ed25519_is_available) {
  EXPECT_TRUE(glyphchain::crypto::available());
}

TEST(crypto_signer, identity_is_deterministic_hex) {
  auto first = glyphchain::testing::make_signer(1);
  auto again = glyphchain::testing::make_signer(1);
  auto other = glyphchain::testing::make_signer(2);
  EXPECT_EQ(first.public_identity.size(), 64u);
  EXPECT_EQ(first.public_identity, again.public_identity);
  EXPECT_NE(first.public_identity, other.public_identity);
}

TEST(crypto_signer, signatures_verify_against_identity) {
  auto signer = glyphchain::testing::make_signer(3);
  auto message = std::string{"unit payload"};
  auto signature = signer.sign(glyphchain::schema::make_bytes_view(message));
  ASSERT_EQ(signature.size(), 64u);
  EXPECT_TRUE(glyphchain::crypto::verify_signature(
      glyphchain::schema::make_bytes_view(message), signer.public_identity,
      glyphchain::schema::make_bytes_view(signature)));

  auto tampered = message + "!";
  EXPECT_FALSE(glyphchain::crypto::verify_signature(
      glyphchain::schema::make_bytes_view(tampered), signer.public_identity,
      glyphchain::schema::make_bytes_view(signature)));

  auto other = glyphchain::testing::make_signer(4);
  EXPECT_FALSE(glyphchain::crypto::verify_signature(
      glyphchain::schema::make_bytes_view(message), other.public_identity,
      glyphchain::schema::make_bytes_view(signature)));
}

TEST(crypto_signer, malformed_inputs_do_not_verify) {
  auto message = glyphchain::schema::bytes_t{0x01};
  auto signature = glyphchain::schema::bytes_t(64, 0x00);
  EXPECT_FALSE(glyphchain::crypto::verify_signature(message, "not-hex", signature));
  EXPECT_FALSE(glyphchain::crypto::verify_signature(
      message, std::string(64, 'a'), glyphchain::schema::bytes_t(12, 0x00)));
}

TEST(crypto_signer, seeds_parse_from_hex) {
  auto seed = glyphchain::crypto::generate_ed25519_seed();
  auto hex = glyphchain::schema::to_hex(
      glyphchain::schema::bytes_view_t{seed.data(), seed.size()});
  auto parsed = glyphchain::crypto::try_parse_seed(hex);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, seed);
  EXPECT_FALSE(glyphchain::crypto::try_parse_seed("abcd").has_value());
  EXPECT_FALSE(glyphchain::crypto::try_parse_seed(std::string(64, 'g')).has_value());
}
