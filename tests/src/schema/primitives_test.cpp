#include <gtest/gtest.h>
#include <gateway/schema/primitives.hpp>

#include <limits>

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = gateway::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
}

TEST(primitives, try_make_hash32_rejects_wrong_length) {
  EXPECT_FALSE(gateway::schema::try_make_hash32("0x0102").has_value());
  EXPECT_FALSE(gateway::schema::try_make_hash32("").has_value());
}

TEST(primitives, hex_is_lowercase_and_prefix_optional) {
  auto bytes = gateway::schema::bytes_t{0x00, 0xAB, 0xFF};
  EXPECT_EQ(gateway::schema::to_hex(bytes), "00abff");
  EXPECT_EQ(gateway::schema::from_hex("0x00ABff"), bytes);
  EXPECT_EQ(gateway::schema::from_hex("00abff"), bytes);
}

TEST(primitives, try_from_hex_rejects_odd_length_and_bad_digits) {
  EXPECT_FALSE(gateway::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(gateway::schema::try_from_hex("0xzz").has_value());
  auto empty = gateway::schema::try_from_hex("0x");
  ASSERT_TRUE(empty.has_value());
  EXPECT_TRUE(empty->empty());
}

TEST(primitives, twenty_byte_address_is_left_padded) {
  auto address = gateway::schema::try_make_address(
      "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf");
  ASSERT_TRUE(address.has_value());
  for (auto i = 0u; i < 12u; ++i) {
    EXPECT_EQ((*address)[i], 0u);
  }
  EXPECT_EQ((*address)[12], 0x7e);
  EXPECT_EQ((*address)[31], 0xdf);
  EXPECT_FALSE(gateway::schema::is_zero(*address));
}

TEST(primitives, address_accepts_full_word_and_rejects_other_sizes) {
  auto word = std::string(64, 'f');
  auto address = gateway::schema::try_make_address(word);
  ASSERT_TRUE(address.has_value());
  EXPECT_EQ((*address)[0], 0xff);
  EXPECT_FALSE(gateway::schema::try_make_address("0x1234").has_value());
}

TEST(primitives, amount_word_conversion_is_big_endian) {
  auto word = gateway::schema::make_word(uint64_t{0x0102});
  EXPECT_EQ(word[30], 0x01);
  EXPECT_EQ(word[31], 0x02);
  EXPECT_EQ(gateway::schema::make_amount(word), 0x0102);
  EXPECT_TRUE(gateway::schema::is_zero(gateway::schema::make_word(0)));

  auto max = std::numeric_limits<gateway::schema::amount_t>::max();
  auto max_word = gateway::schema::make_word(max);
  for (auto byte : max_word) {
    EXPECT_EQ(byte, 0xff);
  }
  EXPECT_EQ(gateway::schema::make_amount(max_word), max);
}

TEST(primitives, try_make_amount_parses_decimal_within_uint256) {
  EXPECT_EQ(gateway::schema::try_make_amount("12345").value_or(0), 12345);
  EXPECT_FALSE(gateway::schema::try_make_amount("").has_value());
  EXPECT_FALSE(gateway::schema::try_make_amount("-1").has_value());
  EXPECT_FALSE(gateway::schema::try_make_amount("0x10").has_value());

  auto max = std::string{
      "115792089237316195423570985008687907853269984665640564039457584007913129"
      "639935"};
  auto parsed = gateway::schema::try_make_amount(max);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, std::numeric_limits<gateway::schema::amount_t>::max());
  EXPECT_FALSE(
      gateway::schema::try_make_amount(max.substr(0, max.size() - 1) + "6")
          .has_value());
}

TEST(primitives, try_make_signature_requires_65_bytes) {
  EXPECT_TRUE(
      gateway::schema::try_make_signature(std::string(130, '1')).has_value());
  EXPECT_FALSE(
      gateway::schema::try_make_signature(std::string(128, '1')).has_value());
}
