#pragma once

#include <gateway/schema/primitives.hpp>
#include <gateway/state/overlay.hpp>

namespace gateway::ledger {

/// Ledger entry for one (token, depositor). withdrawable_at == 0 means no
/// withdrawal is pending.
struct balance final {
  gateway::schema::amount_t available{};
  gateway::schema::amount_t withdrawing{};
  gateway::schema::block_height_t withdrawable_at{};

  gateway::schema::amount_t total() const { return available + withdrawing; }
};

struct reduction final {
  gateway::schema::amount_t from_available{};
  gateway::schema::amount_t from_withdrawing{};

  gateway::schema::amount_t total() const {
    return from_available + from_withdrawing;
  }
};

class balances final {
 public:
  explicit balances(gateway::state::overlay& state);

  balance get(const gateway::schema::address_t& token,
              const gateway::schema::address_t& depositor) const;

  gateway::schema::amount_t total(
      const gateway::schema::address_t& token,
      const gateway::schema::address_t& depositor) const;
  gateway::schema::amount_t available(
      const gateway::schema::address_t& token,
      const gateway::schema::address_t& depositor) const;
  gateway::schema::amount_t withdrawing(
      const gateway::schema::address_t& token,
      const gateway::schema::address_t& depositor) const;
  /// The withdrawing balance once current_block reaches the unlock block,
  /// zero before.
  gateway::schema::amount_t withdrawable(
      const gateway::schema::address_t& token,
      const gateway::schema::address_t& depositor,
      gateway::schema::block_height_t current_block) const;
  gateway::schema::block_height_t withdrawal_block(
      const gateway::schema::address_t& token,
      const gateway::schema::address_t& depositor) const;

  /// Throws balance_overflow when the credit does not fit 256 bits.
  void increase_available(const gateway::schema::address_t& token,
                          const gateway::schema::address_t& depositor,
                          const gateway::schema::amount_t& value);

  /// Requires available >= value (insufficient_available_balance). Adds to
  /// any pending withdrawal and restarts its timer at withdrawable_at.
  void move_to_withdrawing(const gateway::schema::address_t& token,
                           const gateway::schema::address_t& depositor,
                           const gateway::schema::amount_t& value,
                           gateway::schema::block_height_t withdrawable_at);

  /// Zeroes and returns the withdrawing balance (no_withdrawing_balance when
  /// there is none). Clears the unlock block.
  gateway::schema::amount_t empty_withdrawing(
      const gateway::schema::address_t& token,
      const gateway::schema::address_t& depositor);

  /// Drains available first, then withdrawing. Never fails on shortfall:
  /// the returned reduction says how much was actually taken.
  reduction reduce_balance(const gateway::schema::address_t& token,
                           const gateway::schema::address_t& depositor,
                           const gateway::schema::amount_t& value);

 private:
  void put(const gateway::schema::address_t& token,
           const gateway::schema::address_t& depositor,
           const balance& value);

  gateway::state::overlay& state_;
};

}  // namespace gateway::ledger
