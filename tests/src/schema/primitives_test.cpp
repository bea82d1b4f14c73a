#include <gtest/gtest.h>
#include <glyphchain/common/error.hpp>
#include <glyphchain/schema/key/builder.hpp>
#include <glyphchain/schema/key/keys.hpp>
#include <glyphchain/schema/primitives.hpp>
#include <glyphchain/schema/publish_stage.hpp>

TEST(primitives, hex_round_trips_bytes) {
  auto bytes = glyphchain::schema::bytes_t{0x00, 0x01, 0xAB, 0xFF};
  auto hex = glyphchain::schema::to_hex(bytes);
  EXPECT_EQ(hex, "0001abff");
  EXPECT_EQ(glyphchain::schema::from_hex(hex), bytes);
  EXPECT_EQ(glyphchain::schema::from_hex("0x0001ABFF"), bytes);
}

TEST(primitives, try_from_hex_rejects_malformed_input) {
  EXPECT_FALSE(glyphchain::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(glyphchain::schema::try_from_hex("zz").has_value());
  EXPECT_TRUE(glyphchain::schema::try_from_hex("").has_value());
}

TEST(primitives, try_make_hash32_requires_32_bytes) {
  auto hex = std::string(64, 'a');
  auto hash = glyphchain::schema::try_make_hash32(hex);
  ASSERT_TRUE(hash.has_value());
  EXPECT_EQ((*hash)[0], 0xAA);
  EXPECT_EQ(glyphchain::schema::to_hex(*hash), hex);
  EXPECT_FALSE(glyphchain::schema::try_make_hash32("aabb").has_value());
}

TEST(primitives, base64_round_trips_bytes) {
  auto payload = glyphchain::schema::bytes_t{0x01, 0x02, 0x03, 0xFE, 0xFF};
  auto encoded = glyphchain::schema::to_base64(payload);
  EXPECT_EQ(encoded, "AQID/v8=");
  EXPECT_EQ(glyphchain::schema::from_base64(encoded), payload);
}

TEST(primitives, try_from_base64_rejects_invalid_input) {
  EXPECT_FALSE(glyphchain::schema::try_from_base64("not base64***").has_value());
}

TEST(primitives, base64_encoded_size_matches_encoder) {
  for (auto size : {0u, 1u, 2u, 3u, 4u, 100u, 566u}) {
    auto bytes = glyphchain::schema::bytes_t(size, 0x5A);
    EXPECT_EQ(glyphchain::schema::to_base64(bytes).size(),
              glyphchain::schema::base64_encoded_size(size))
        << size;
  }
}

TEST(primitives, builder_length_prefixes_fields) {
  auto ab_c = glyphchain::schema::key::builder{}.write_field("ab").write_field("c");
  auto a_bc = glyphchain::schema::key::builder{}.write_field("a").write_field("bc");
  EXPECT_NE(ab_c.data, a_bc.data);
  EXPECT_EQ(ab_c.data.size(), 4u + 2u + 4u + 1u);
  EXPECT_EQ(ab_c.data[0], 2u);
}

TEST(primitives, keys_carry_their_prefix) {
  auto key = glyphchain::schema::key::make_chain_head_key("alice");
  EXPECT_EQ(glyphchain::schema::make_string(key), "SYS|HEAD|alice");
  EXPECT_EQ(glyphchain::schema::key::key_suffix(
                glyphchain::schema::key::kChainHeadPrefix, key),
            "alice");
  EXPECT_TRUE(glyphchain::schema::key::key_suffix(
                  glyphchain::schema::key::kOperationPrefix, key)
                  .empty());
}

TEST(primitives, enum_names_are_stable) {
  EXPECT_EQ(glyphchain::common::to_string(
                glyphchain::common::error_code::corrupt_chunk),
            "corrupt_chunk");
  EXPECT_EQ(glyphchain::schema::try_from_string<glyphchain::common::error_code>(
                "concurrent_publish_conflict"),
            glyphchain::common::error_code::concurrent_publish_conflict);
  EXPECT_EQ(glyphchain::schema::to_string(
                glyphchain::schema::publish_stage_t::partial),
            "partial");
  EXPECT_TRUE(glyphchain::schema::is_terminal(
      glyphchain::schema::publish_stage_t::completed));
  EXPECT_FALSE(glyphchain::schema::is_terminal(
      glyphchain::schema::publish_stage_t::partial));
}

TEST(primitives, error_carries_code_and_message) {
  auto e = glyphchain::common::error{glyphchain::common::error_code::missing_chunk,
                                     "chunk 3 is missing"};
  EXPECT_EQ(e.code(), glyphchain::common::error_code::missing_chunk);
  EXPECT_STREQ(e.what(), "missing_chunk: chunk 3 is missing");
}
