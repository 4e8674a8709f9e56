#include <gateway/crypto/keccak.hpp>
#include <gateway/crypto/secp256k1.hpp>
#include <gateway/schema/primitives.hpp>
#include <gateway/testing/common.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <array>

namespace {

gateway::schema::address_t expected_address(const std::string_view hex) {
  auto address = gateway::schema::try_make_address(hex);
  EXPECT_TRUE(address.has_value());
  return address.value_or(gateway::schema::address_t{});
}

}  // namespace

TEST(secp256k1, backend_is_available) {
  EXPECT_TRUE(gateway::crypto::available());
}

TEST(secp256k1, address_from_private_key_matches_known_addresses) {
  auto one = gateway::crypto::address_from_private_key(
      gateway::testing::make_private_key(1));
  ASSERT_TRUE(one.has_value());
  EXPECT_EQ(*one,
            expected_address("0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf"));

  auto two = gateway::crypto::address_from_private_key(
      gateway::testing::make_private_key(2));
  ASSERT_TRUE(two.has_value());
  EXPECT_EQ(*two,
            expected_address("0x2B5AD5c4795c026514f8317c7a215E218DcCD6cF"));
}

TEST(secp256k1, zero_private_key_is_rejected) {
  EXPECT_FALSE(gateway::crypto::address_from_private_key(
                   gateway::schema::private_key_t{})
                   .has_value());
}

TEST(secp256k1, sign_then_recover_yields_signer) {
  auto digest = gateway::crypto::keccak256(std::string_view{"gateway"});
  auto key = gateway::testing::make_private_key(7);
  auto signature = gateway::crypto::sign_digest(digest, key);
  ASSERT_TRUE(signature.has_value());
  EXPECT_TRUE((*signature)[64] == 27 || (*signature)[64] == 28);

  auto recovered = gateway::crypto::recover_address(digest, *signature);
  ASSERT_TRUE(recovered.has_value());
  EXPECT_EQ(*recovered, gateway::crypto::address_from_private_key(key));
}

TEST(secp256k1, recovery_over_other_digest_yields_other_address) {
  auto digest = gateway::crypto::keccak256(std::string_view{"gateway"});
  auto key = gateway::testing::make_private_key(7);
  auto signature = gateway::crypto::sign_digest(digest, key);
  ASSERT_TRUE(signature.has_value());

  auto other = gateway::crypto::keccak256(std::string_view{"other"});
  auto recovered = gateway::crypto::recover_address(other, *signature);
  if (recovered.has_value()) {
    EXPECT_NE(*recovered, gateway::crypto::address_from_private_key(key));
  }
}

TEST(secp256k1, malformed_signatures_do_not_recover) {
  auto digest = gateway::crypto::keccak256(std::string_view{"gateway"});
  auto signature = gateway::crypto::sign_digest(
      digest, gateway::testing::make_private_key(3));
  ASSERT_TRUE(signature.has_value());

  auto bad_v = *signature;
  bad_v[64] = 29;
  EXPECT_FALSE(gateway::crypto::recover_address(digest, bad_v).has_value());

  auto zero_r = *signature;
  std::fill(zero_r.begin(), zero_r.begin() + 32, uint8_t{0});
  EXPECT_FALSE(gateway::crypto::recover_address(digest, zero_r).has_value());

  EXPECT_FALSE(gateway::crypto::recover_address(digest,
                                                gateway::schema::signature_t{})
                   .has_value());
}

TEST(secp256k1, high_s_signature_is_rejected) {
  auto digest = gateway::crypto::keccak256(std::string_view{"malleable"});
  auto signature = gateway::crypto::sign_digest(
      digest, gateway::testing::make_private_key(5));
  ASSERT_TRUE(signature.has_value());

  // n - s, with v flipped, is the malleable twin of a low-s signature.
  static constexpr auto kOrder = std::array<uint8_t, 32>{
      0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
      0xff, 0xff, 0xff, 0xff, 0xfe, 0xba, 0xae, 0xdc, 0xe6, 0xaf, 0x48,
      0xa0, 0x3b, 0xbf, 0xd2, 0x5e, 0x8c, 0xd0, 0x36, 0x41, 0x41};
  auto twin = *signature;
  auto borrow = 0;
  for (int i = 31; i >= 0; --i) {
    auto index = static_cast<std::size_t>(i);
    auto diff = static_cast<int>(kOrder[index]) -
                static_cast<int>((*signature)[32 + index]) - borrow;
    borrow = diff < 0 ? 1 : 0;
    twin[32 + static_cast<std::size_t>(i)] =
        static_cast<uint8_t>(diff < 0 ? diff + 256 : diff);
  }
  twin[64] = (*signature)[64] == 27 ? 28 : 27;
  EXPECT_FALSE(gateway::crypto::recover_address(digest, twin).has_value());
}

TEST(secp256k1, eth_signed_message_hash_prefixes_the_digest) {
  auto message = gateway::crypto::keccak256(std::string_view{"batch"});
  auto expected = gateway::crypto::keccak256_hasher{}
                      .update(std::string_view{"\x19"
                                               "Ethereum Signed Message:\n32"})
                      .update(message)
                      .finalize();
  EXPECT_EQ(gateway::crypto::eth_signed_message_hash(message), expected);
}
