#include <gateway/schema/primitives.hpp>
#include <gateway/state/overlay.hpp>
#include <gateway/testing/state_fixture.hpp>
#include <gtest/gtest.h>

#include <string_view>

namespace {

gateway::schema::bytes_t make_key(const std::string_view name) {
  return gateway::schema::make_bytes(name);
}

}  // namespace

TEST(overlay, reads_see_buffered_writes_before_commit) {
  auto fixture = gateway::testing::state_fixture{"gateway_overlay_reads"};
  auto state = fixture.make_overlay();
  auto key = make_key("SYS|STATE|TEST|A");

  state.put<uint64_t>(key, 42);
  EXPECT_EQ(state.get<uint64_t>(key).value_or(0), 42u);
  EXPECT_TRUE(state.contains(key));
  EXPECT_EQ(state.pending(), 1u);
  EXPECT_FALSE(fixture.storage().get_raw(key).has_value());
}

TEST(overlay, commit_applies_writes_and_deletes_together) {
  auto fixture = gateway::testing::state_fixture{"gateway_overlay_commit"};
  auto first = make_key("SYS|STATE|TEST|A");
  auto second = make_key("SYS|STATE|TEST|B");
  {
    auto state = fixture.make_overlay();
    state.put<uint64_t>(first, 1);
    state.put<uint64_t>(second, 2);
    state.commit();
  }
  auto state = fixture.make_overlay();
  state.erase(first);
  state.put<uint64_t>(second, 3);
  EXPECT_FALSE(state.contains(first));
  state.commit();
  EXPECT_EQ(state.pending(), 0u);

  EXPECT_FALSE(fixture.storage().get_raw(first).has_value());
  EXPECT_EQ(
      fixture.storage().get<uint64_t>(fixture.encoder(), second).value_or(0),
      3u);
}

TEST(overlay, discard_leaves_storage_untouched) {
  auto fixture = gateway::testing::state_fixture{"gateway_overlay_discard"};
  auto key = make_key("SYS|STATE|TEST|A");
  {
    auto state = fixture.make_overlay();
    state.put<uint64_t>(key, 1);
    state.commit();
  }
  auto state = fixture.make_overlay();
  state.put<uint64_t>(key, 2);
  state.erase(make_key("SYS|STATE|TEST|B"));
  state.discard();
  EXPECT_EQ(state.pending(), 0u);
  EXPECT_EQ(state.get<uint64_t>(key).value_or(0), 1u);
}

TEST(overlay, typed_reads_fall_through_to_storage_unless_erased) {
  auto fixture = gateway::testing::state_fixture{"gateway_overlay_typed"};
  auto key = make_key("SYS|STATE|TEST|A");
  fixture.storage().commit({{key, fixture.encoder().encode(uint64_t{9})}});

  auto state = fixture.make_overlay();
  EXPECT_EQ(state.get<uint64_t>(key).value_or(0), 9u);
  state.erase(key);
  EXPECT_FALSE(state.get<uint64_t>(key).has_value());
  EXPECT_EQ(
      fixture.storage().get<uint64_t>(fixture.encoder(), key).value_or(0), 9u);
}
