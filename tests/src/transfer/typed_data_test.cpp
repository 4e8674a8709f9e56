#include <gateway/crypto/keccak.hpp>
#include <gateway/schema/primitives.hpp>
#include <gateway/transfer/typed_data.hpp>
#include <gtest/gtest.h>

namespace typed_data = gateway::transfer::typed_data;

TEST(typed_data, keccak_of_standard_domain_type_matches_known_hash) {
  auto hash = gateway::crypto::keccak256(std::string_view{
      "EIP712Domain(string name,string version,uint256 chainId,address "
      "verifyingContract)"});
  EXPECT_EQ(gateway::schema::to_hex(hash),
            "8b73c3c69bb8fe3d512ecc4cf759cc79239f7b179b0ffacaa9a75d522b39400f");
}

TEST(typed_data, referenced_types_follow_the_primary_type) {
  EXPECT_EQ(typed_data::burn_intent_type(),
            std::string{typed_data::kBurnIntentPrimaryType} +
                std::string{typed_data::kTransferSpecType});
  EXPECT_EQ(typed_data::burn_intent_set_type().find("BurnIntentSet("), 0u);
  EXPECT_NE(typed_data::burn_intent_set_type().find(")BurnIntent("),
            std::string::npos);
  EXPECT_NE(typed_data::attestation_set_type().find(")Attestation("),
            std::string::npos);
}

TEST(typed_data, type_hashes_are_keccak_of_type_strings) {
  EXPECT_EQ(typed_data::transfer_spec_type_hash(),
            gateway::crypto::keccak256(typed_data::kTransferSpecType));
  EXPECT_EQ(typed_data::burn_intent_type_hash(),
            gateway::crypto::keccak256(typed_data::burn_intent_type()));
  EXPECT_EQ(typed_data::attestation_set_type_hash(),
            gateway::crypto::keccak256(typed_data::attestation_set_type()));
  EXPECT_NE(typed_data::burn_intent_type_hash(),
            typed_data::attestation_type_hash());
}

TEST(typed_data, domain_separator_hashes_name_and_version) {
  auto wallet = typed_data::domain_separator(typed_data::wallet_domain());
  auto expected = gateway::crypto::keccak256_hasher{}
                      .update(typed_data::domain_type_hash())
                      .update(gateway::crypto::keccak256(
                          std::string_view{"GatewayWallet"}))
                      .update(gateway::crypto::keccak256(std::string_view{"1"}))
                      .finalize();
  EXPECT_EQ(wallet, expected);
  EXPECT_NE(wallet, typed_data::domain_separator(typed_data::minter_domain()));
  EXPECT_NE(wallet, typed_data::domain_separator(
                        typed_data::domain{.name = "GatewayWallet",
                                           .version = "2"}));
}

TEST(typed_data, digest_prefixes_0x1901) {
  auto separator = typed_data::domain_separator(typed_data::wallet_domain());
  auto struct_hash = gateway::crypto::keccak256(std::string_view{"s"});
  auto preimage = gateway::schema::bytes_t{0x19, 0x01};
  preimage.insert(preimage.end(), separator.begin(), separator.end());
  preimage.insert(preimage.end(), struct_hash.begin(), struct_hash.end());
  EXPECT_EQ(typed_data::digest(separator, struct_hash),
            gateway::crypto::keccak256(preimage));
}

TEST(typed_data, array_hash_of_no_elements_uses_empty_keccak) {
  auto type_hash = typed_data::burn_intent_set_type_hash();
  auto expected = gateway::crypto::keccak256_hasher{}
                      .update(type_hash)
                      .update(gateway::crypto::keccak256(std::string_view{}))
                      .finalize();
  EXPECT_EQ(typed_data::array_struct_hash(type_hash, {}), expected);
}
