#include <gateway/schema/error.hpp>
#include <gateway/testing/payloads.hpp>
#include <gateway/transfer/cursor.hpp>
#include <gateway/transfer/layout.hpp>
#include <gateway/transfer/payload_set.hpp>
#include <gtest/gtest.h>

#include <boost/endian/conversion.hpp>

#include <optional>
#include <vector>

namespace {

using gateway::schema::error;
using gateway::schema::error_code;
using gateway::transfer::attestation_set_traits;
using gateway::transfer::burn_intent_set_traits;
using gateway::transfer::burn_intent_set_view;

gateway::schema::bytes_t make_intent_bytes(const uint64_t value,
                                           const uint8_t salt) {
  return gateway::transfer::encode(gateway::testing::make_intent(
      gateway::testing::make_spec(value, salt), 0));
}

gateway::schema::bytes_t make_intent_set(const std::size_t count) {
  auto elements = std::vector<gateway::schema::bytes_t>{};
  for (std::size_t i = 0; i < count; ++i) {
    elements.push_back(
        make_intent_bytes(10 + i, static_cast<uint8_t>(i + 1)));
  }
  return gateway::transfer::encode_set<burn_intent_set_traits>(elements);
}

struct set_failure final {
  error_code code;
  std::optional<uint64_t> index;
};

set_failure validation_failure(const gateway::schema::bytes_t& bytes) {
  try {
    burn_intent_set_view::cast(bytes).validate();
  } catch (const error& e) {
    return {e.code(), e.index()};
  }
  ADD_FAILURE() << "expected validation to fail";
  return {error_code::data_too_short, std::nullopt};
}

}  // namespace

TEST(payload_set, encodes_header_and_concatenated_elements) {
  auto set = make_intent_set(3);
  EXPECT_EQ(set.size(), 12u + (3u * 416u));

  auto view = burn_intent_set_view::cast(set);
  view.validate();
  EXPECT_EQ(view.version(), 1u);
  EXPECT_EQ(view.num_elements(), 3u);
}

TEST(payload_set, empty_set_is_valid) {
  auto set = make_intent_set(0);
  auto view = burn_intent_set_view::cast(set);
  view.validate();
  EXPECT_EQ(view.num_elements(), 0u);

  auto it = gateway::transfer::burn_intent_cursor{view};
  EXPECT_TRUE(it.done());
  EXPECT_EQ(it.size(), 0u);
}

TEST(payload_set, count_larger_than_elements_reports_index) {
  auto set = make_intent_set(2);
  boost::endian::store_big_u32(
      set.data() + gateway::transfer::layout::payload_set::kNumElements, 3);
  auto failure = validation_failure(set);
  EXPECT_EQ(failure.code, error_code::element_header_too_short);
  ASSERT_TRUE(failure.index.has_value());
  EXPECT_EQ(*failure.index, 2u);
}

TEST(payload_set, truncated_element_reports_index) {
  auto set = make_intent_set(2);
  set.resize(set.size() - 10);
  auto failure = validation_failure(set);
  EXPECT_EQ(failure.code, error_code::element_too_short);
  ASSERT_TRUE(failure.index.has_value());
  EXPECT_EQ(*failure.index, 1u);
}

TEST(payload_set, foreign_element_magic_reports_index) {
  auto elements = std::vector<gateway::schema::bytes_t>{
      make_intent_bytes(1, 1),
      gateway::transfer::encode(gateway::transfer::attestation{
          .spec = gateway::testing::make_spec(1, 2)})};
  // Attestation headers are shorter; pad so the outer walk reaches the magic.
  elements[1].resize(76 + 340);
  boost::endian::store_big_u32(
      elements[1].data() +
          gateway::transfer::layout::burn_intent::kTransferSpecLength,
      340);
  auto set = gateway::transfer::encode_set<burn_intent_set_traits>(elements);
  auto failure = validation_failure(set);
  EXPECT_EQ(failure.code, error_code::invalid_element_magic);
  ASSERT_TRUE(failure.index.has_value());
  EXPECT_EQ(*failure.index, 1u);
}

TEST(payload_set, trailing_bytes_are_an_overall_mismatch) {
  auto set = make_intent_set(1);
  set.push_back(0);
  auto failure = validation_failure(set);
  EXPECT_EQ(failure.code, error_code::overall_length_mismatch);
  EXPECT_FALSE(failure.index.has_value());
}

TEST(payload_set, short_header_and_bad_version_are_rejected) {
  auto set = make_intent_set(1);
  auto header_only = gateway::schema::bytes_t{set.begin(), set.begin() + 8};
  EXPECT_EQ(validation_failure(header_only).code,
            error_code::header_too_short);

  boost::endian::store_big_u32(
      set.data() + gateway::transfer::layout::payload_set::kVersion, 0);
  EXPECT_EQ(validation_failure(set).code, error_code::invalid_version);
}

TEST(cursor, yields_exactly_num_elements_then_fails) {
  auto set = make_intent_set(3);
  auto it = gateway::transfer::burn_intent_cursor{
      burn_intent_set_view::cast(set)};
  ASSERT_EQ(it.size(), 3u);
  for (uint32_t i = 0; i < 3; ++i) {
    EXPECT_FALSE(it.done());
    EXPECT_EQ(it.index(), i);
    auto intent = it.next();
    EXPECT_EQ(intent.spec().value(), 10 + i);
  }
  EXPECT_TRUE(it.done());
  try {
    (void)it.next();
    FAIL() << "expected cursor out of bounds";
  } catch (const error& e) {
    EXPECT_EQ(e.code(), error_code::cursor_out_of_bounds);
  }
}

TEST(cursor, validates_each_element_as_it_goes) {
  auto set = make_intent_set(2);
  // Corrupt the second element's embedded spec version; outer framing holds.
  auto second_spec = 12u + 416u + 76u;
  boost::endian::store_big_u32(
      set.data() + second_spec +
          gateway::transfer::layout::transfer_spec::kVersion,
      9);
  auto it = gateway::transfer::burn_intent_cursor{
      burn_intent_set_view::cast(set)};
  EXPECT_EQ(it.next().spec().value(), 10);
  try {
    (void)it.next();
    FAIL() << "expected invalid version";
  } catch (const error& e) {
    EXPECT_EQ(e.code(), error_code::invalid_version);
  }
}

TEST(cursor, single_payload_is_a_set_of_one) {
  auto single = make_intent_bytes(42, 1);
  auto it = gateway::transfer::burn_intent_cursor{
      gateway::transfer::burn_intent_view::cast(single)};
  EXPECT_EQ(it.size(), 1u);
  EXPECT_EQ(it.next().spec().value(), 42);
  EXPECT_TRUE(it.done());
}

TEST(payload, parse_dispatches_on_magic) {
  auto single = make_intent_bytes(42, 1);
  auto parsed = gateway::transfer::burn_intent_payload::parse(single);
  EXPECT_FALSE(parsed.is_set());

  auto set = make_intent_set(2);
  auto parsed_set = gateway::transfer::burn_intent_payload::parse(set);
  EXPECT_TRUE(parsed_set.is_set());
  EXPECT_EQ(parsed_set.elements().size(), 2u);

  auto spec = gateway::transfer::encode(gateway::testing::make_spec(1));
  try {
    (void)gateway::transfer::burn_intent_payload::parse(spec);
    FAIL() << "expected invalid magic";
  } catch (const error& e) {
    EXPECT_EQ(e.code(), error_code::invalid_magic);
  }
}

TEST(payload, set_hash_differs_from_single_element_hash) {
  auto single = make_intent_bytes(10, 1);
  auto set = gateway::transfer::encode_set<burn_intent_set_traits>(
      std::vector<gateway::schema::bytes_t>{single});
  auto single_hash =
      gateway::transfer::burn_intent_payload::parse(single).typed_data_hash();
  auto set_hash =
      gateway::transfer::burn_intent_payload::parse(set).typed_data_hash();
  EXPECT_NE(single_hash, set_hash);
  EXPECT_EQ(set_hash,
            gateway::transfer::typed_data::array_struct_hash(
                gateway::transfer::typed_data::burn_intent_set_type_hash(),
                {single_hash}));
}

TEST(payload, attestation_sets_use_their_own_magic) {
  auto elements = std::vector<gateway::transfer::attestation>{
      {.spec = gateway::testing::make_spec(1, 1)},
      {.spec = gateway::testing::make_spec(2, 2)}};
  auto set = gateway::transfer::encode_set<attestation_set_traits>(elements);
  EXPECT_EQ(set[0], 0x1e);
  EXPECT_EQ(set[3], 0x71);
  auto parsed = gateway::transfer::attestation_payload::parse(set);
  EXPECT_TRUE(parsed.is_set());
  EXPECT_EQ(parsed.elements().size(), 2u);
}
