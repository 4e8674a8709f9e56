#include <gateway/crypto/keccak.hpp>
#include <gateway/schema/primitives.hpp>
#include <gtest/gtest.h>

#include <string>

namespace {

std::string hex_of(const gateway::schema::hash32_t& hash) {
  return gateway::schema::to_hex(hash);
}

}  // namespace

TEST(keccak, empty_input_matches_known_digest) {
  EXPECT_EQ(hex_of(gateway::crypto::keccak256(std::string_view{})),
            "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
}

TEST(keccak, short_input_matches_known_digest) {
  EXPECT_EQ(hex_of(gateway::crypto::keccak256(std::string_view{"abc"})),
            "4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");
}

TEST(keccak, event_signature_matches_known_digest) {
  EXPECT_EQ(hex_of(gateway::crypto::keccak256(
                std::string_view{"Transfer(address,address,uint256)"})),
            "ddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef");
}

TEST(keccak, incremental_updates_match_one_shot_across_blocks) {
  auto input = std::string(300, 'g');
  auto one_shot = gateway::crypto::keccak256(std::string_view{input});

  auto hasher = gateway::crypto::keccak256_hasher{};
  hasher.update(std::string_view{input}.substr(0, 1));
  hasher.update(std::string_view{input}.substr(1, 135));
  hasher.update(std::string_view{input}.substr(136, 100));
  hasher.update(std::string_view{input}.substr(236));
  EXPECT_EQ(hasher.finalize(), one_shot);
}

TEST(keccak, rate_sized_input_differs_from_one_byte_less) {
  auto input = std::string(136, 'x');
  auto full = gateway::crypto::keccak256(std::string_view{input});
  auto shorter =
      gateway::crypto::keccak256(std::string_view{input}.substr(0, 135));
  EXPECT_NE(full, shorter);
}

TEST(keccak, empty_updates_leave_digest_unchanged) {
  auto hasher = gateway::crypto::keccak256_hasher{};
  hasher.update(std::string_view{})
      .update(std::string_view{"abc"})
      .update(gateway::schema::bytes_view_t{});
  EXPECT_EQ(hex_of(hasher.finalize()),
            "4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");
}
