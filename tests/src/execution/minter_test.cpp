#include <gateway/execution/events.hpp>
#include <gateway/schema/error_code.hpp>
#include <gateway/testing/execution_fixture.hpp>
#include <gateway/testing/payloads.hpp>
#include <gateway/transfer/payload_set.hpp>
#include <gtest/gtest.h>

#include <vector>

namespace {

using gateway::execution::call_context;
using gateway::schema::error_code;
using gateway::testing::code_of;
using gateway::testing::make_spec;
using gateway::testing::minter_fixture;

const auto kDestinationToken = gateway::testing::make_address(4);
const auto kRecipient = gateway::testing::make_address(5);
const auto kRelayer = gateway::testing::make_address(12);

call_context relayer() {
  return call_context{.block_height = 1, .sender = kRelayer};
}

gateway::schema::bytes_t attestation_bytes(
    gateway::transfer::transfer_spec spec) {
  return gateway::transfer::encode(
      gateway::transfer::attestation{.spec = std::move(spec)});
}

gateway::schema::transaction_result_t mint(
    minter_fixture& fixture,
    const gateway::schema::bytes_t& payload,
    const uint8_t signer_seed = 8) {
  auto signature = gateway::testing::sign_payload<
      gateway::transfer::attestation_set_traits>(
      payload, gateway::transfer::typed_data::minter_domain(), signer_seed);
  return fixture.engine().mint(relayer(), payload, signature);
}

}  // namespace

TEST(minter, mints_single_attestation_once) {
  auto fixture = minter_fixture{"gateway_minter_single",
                                gateway::testing::make_minter_options()};
  auto payload = attestation_bytes(make_spec(500));
  auto result = mint(fixture, payload);
  ASSERT_EQ(result.code, 0u) << result.log << " " << result.info;
  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.events[0].type, "GatewayMinted");
  EXPECT_EQ(gateway::execution::find_attribute(result.events[0], "value"),
            "500");

  ASSERT_EQ(fixture.calls().size(), 1u);
  EXPECT_EQ(fixture.calls()[0].operation, "mint");
  EXPECT_EQ(fixture.calls()[0].token, kDestinationToken);
  EXPECT_EQ(fixture.calls()[0].account, kRecipient);
  EXPECT_EQ(fixture.calls()[0].value, 500);

  auto replay = mint(fixture, payload);
  EXPECT_EQ(code_of(replay), error_code::transfer_spec_already_used_at_index);
  EXPECT_EQ(fixture.calls().size(), 1u);
}

TEST(minter, set_skips_other_destination_domains) {
  auto fixture = minter_fixture{"gateway_minter_set",
                                gateway::testing::make_minter_options()};
  auto foreign = make_spec(7, 2);
  foreign.destination_domain = 99;
  auto set = gateway::transfer::encode_set<
      gateway::transfer::attestation_set_traits>(
      std::vector<gateway::schema::bytes_t>{
          attestation_bytes(make_spec(1, 1)), attestation_bytes(foreign),
          attestation_bytes(make_spec(3, 3))});
  auto result = mint(fixture, set);
  ASSERT_EQ(result.code, 0u) << result.log;
  EXPECT_EQ(result.events.size(), 2u);
  EXPECT_EQ(fixture.calls().size(), 2u);
}

TEST(minter, only_attestation_signers_are_accepted) {
  auto fixture = minter_fixture{"gateway_minter_signer",
                                gateway::testing::make_minter_options()};
  auto payload = attestation_bytes(make_spec(5));
  EXPECT_EQ(code_of(mint(fixture, payload, 3)),
            error_code::invalid_attestation_signer);

  ASSERT_EQ(fixture.engine()
                .add_attestation_signer(gateway::testing::address_of(3))
                .code,
            0u);
  EXPECT_TRUE(
      fixture.engine().is_attestation_signer(gateway::testing::address_of(3)));
  EXPECT_EQ(mint(fixture, payload, 3).code, 0u);

  ASSERT_EQ(fixture.engine()
                .remove_attestation_signer(gateway::testing::address_of(8))
                .code,
            0u);
  EXPECT_EQ(code_of(mint(fixture, attestation_bytes(make_spec(5, 2)))),
            error_code::invalid_attestation_signer);
}

TEST(minter, destination_fields_are_checked_with_index) {
  auto fixture = minter_fixture{"gateway_minter_checks",
                                gateway::testing::make_minter_options()};

  auto zero = make_spec(0, 1);
  EXPECT_EQ(code_of(mint(fixture, attestation_bytes(zero))),
            error_code::attestation_value_must_be_positive_at_index);

  auto contract = make_spec(1, 2);
  contract.destination_contract = gateway::testing::make_address(60);
  EXPECT_EQ(code_of(mint(fixture, attestation_bytes(contract))),
            error_code::destination_contract_mismatch_at_index);

  auto token = make_spec(1, 3);
  token.destination_token = gateway::testing::make_address(61);
  EXPECT_EQ(code_of(mint(fixture, attestation_bytes(token))),
            error_code::unsupported_destination_token_at_index);

  auto caller = make_spec(1, 4);
  caller.destination_caller = gateway::testing::make_address(62);
  auto rejected = mint(fixture, attestation_bytes(caller));
  EXPECT_EQ(code_of(rejected),
            error_code::destination_caller_mismatch_at_index);
  EXPECT_EQ(rejected.info.rfind("index=0;", 0), 0u);

  auto allowed = make_spec(1, 5);
  allowed.destination_caller = kRelayer;
  EXPECT_EQ(mint(fixture, attestation_bytes(allowed)).code, 0u);
  EXPECT_EQ(fixture.calls().size(), 1u);
}

TEST(minter, failure_in_a_set_mints_nothing) {
  auto fixture = minter_fixture{"gateway_minter_atomic",
                                gateway::testing::make_minter_options()};
  auto first = attestation_bytes(make_spec(1, 1));
  auto bad = make_spec(1, 2);
  bad.destination_contract = gateway::testing::make_address(60);
  auto set = gateway::transfer::encode_set<
      gateway::transfer::attestation_set_traits>(
      std::vector<gateway::schema::bytes_t>{first, attestation_bytes(bad)});

  auto result = mint(fixture, set);
  EXPECT_EQ(code_of(result),
            error_code::destination_contract_mismatch_at_index);
  EXPECT_EQ(result.info, "index=1");
  EXPECT_TRUE(fixture.calls().empty());
  EXPECT_FALSE(fixture.engine().is_transfer_spec_used(
      gateway::transfer::attestation_view::cast(first).spec().hash()));
}

TEST(minter, nothing_for_this_domain_is_an_error) {
  auto fixture = minter_fixture{"gateway_minter_irrelevant",
                                gateway::testing::make_minter_options()};
  auto foreign = make_spec(1);
  foreign.destination_domain = 99;
  EXPECT_EQ(code_of(mint(fixture, attestation_bytes(foreign))),
            error_code::no_relevant_attestations);
}

TEST(minter, malformed_payload_reports_codec_error) {
  auto fixture = minter_fixture{"gateway_minter_malformed",
                                gateway::testing::make_minter_options()};
  auto payload = attestation_bytes(make_spec(1));
  payload.push_back(0);
  auto result = fixture.engine().mint(relayer(), payload,
                                      gateway::schema::signature_t{});
  EXPECT_EQ(code_of(result),
            error_code::transfer_payload_overall_length_mismatch);
  EXPECT_EQ(result.codespace, "gateway.minter");
}
