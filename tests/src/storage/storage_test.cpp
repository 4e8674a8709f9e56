#include <gateway/schema/encoding/scale/encoder.hpp>
#include <gateway/storage/rocksdb/storage.hpp>
#include <gateway/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace {

using encoder_t = gateway::schema::encoding::scale_encoder_t;

gateway::schema::bytes_t make_key(const std::string_view name) {
  return gateway::schema::make_bytes(name);
}

gateway::storage::rocksdb_storage_t open(const std::string& path) {
  return gateway::storage::make_storage<gateway::storage::rocksdb_storage_tag>(
      path);
}

}  // namespace

TEST(storage, committed_scale_values_decode_through_typed_get) {
  auto db = gateway::testing::make_db_path("gateway_storage_typed");
  {
    auto storage = open(db);
    auto encoder = encoder_t{};
    using entry_t = std::tuple<gateway::schema::word_t, uint64_t>;
    auto value = entry_t{gateway::testing::make_hash(3), 77};
    storage.commit({{make_key("SYS|STATE|X"), encoder.encode(value)}});

    auto loaded = storage.get<entry_t>(encoder, make_key("SYS|STATE|X"));
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(std::get<0>(*loaded), gateway::testing::make_hash(3));
    EXPECT_EQ(std::get<1>(*loaded), 77u);

    EXPECT_FALSE(
        storage.get<entry_t>(encoder, make_key("SYS|STATE|Y")).has_value());
  }
  gateway::testing::remove_path(db);
}

TEST(storage, commit_applies_puts_and_deletes) {
  auto db = gateway::testing::make_db_path("gateway_storage_commit");
  {
    auto storage = open(db);
    storage.commit({{make_key("K|1"), gateway::schema::bytes_t{1}},
                    {make_key("K|2"), gateway::schema::bytes_t{2}}});
    storage.commit({{make_key("K|1"), std::nullopt},
                    {make_key("K|3"), gateway::schema::bytes_t{3}}});

    EXPECT_FALSE(storage.get_raw(make_key("K|1")).has_value());
    EXPECT_TRUE(storage.get_raw(make_key("K|2")).has_value());
    EXPECT_TRUE(storage.get_raw(make_key("K|3")).has_value());
  }
  gateway::testing::remove_path(db);
}

TEST(storage, state_survives_reopen) {
  auto db = gateway::testing::make_db_path("gateway_storage_reopen");
  {
    auto storage = open(db);
    storage.commit({{make_key("P|1"), gateway::schema::bytes_t{9, 9}}});
  }
  {
    auto storage = open(db);
    auto raw = storage.get_raw(make_key("P|1"));
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(*raw, (gateway::schema::bytes_t{9, 9}));
  }
  gateway::testing::remove_path(db);
}
