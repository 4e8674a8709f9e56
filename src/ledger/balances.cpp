#include <gateway/ledger/balances.hpp>
#include <gateway/schema/error.hpp>
#include <gateway/state/keys.hpp>

#include <algorithm>
#include <limits>
#include <tuple>

namespace gateway::ledger {

namespace {

using stored_balance_t = std::tuple<gateway::schema::word_t,
                                    gateway::schema::word_t,
                                    gateway::schema::block_height_t>;

}  // namespace

balances::balances(gateway::state::overlay& state) : state_{state} {}

balance balances::get(const gateway::schema::address_t& token,
                      const gateway::schema::address_t& depositor) const {
  auto balance_key = gateway::state::key::make_balance_key(token, depositor);
  auto stored = state_.get<stored_balance_t>(
      gateway::schema::bytes_view_t{balance_key});
  if (!stored.has_value()) {
    return {};
  }
  return balance{
      .available = gateway::schema::make_amount(std::get<0>(*stored)),
      .withdrawing = gateway::schema::make_amount(std::get<1>(*stored)),
      .withdrawable_at = std::get<2>(*stored)};
}

void balances::put(const gateway::schema::address_t& token,
                   const gateway::schema::address_t& depositor,
                   const balance& value) {
  auto balance_key = gateway::state::key::make_balance_key(token, depositor);
  if (value.available == 0 && value.withdrawing == 0 &&
      value.withdrawable_at == 0) {
    state_.erase(gateway::schema::bytes_view_t{balance_key});
    return;
  }
  state_.put(gateway::schema::bytes_view_t{balance_key},
             stored_balance_t{gateway::schema::make_word(value.available),
                              gateway::schema::make_word(value.withdrawing),
                              value.withdrawable_at});
}

gateway::schema::amount_t balances::total(
    const gateway::schema::address_t& token,
    const gateway::schema::address_t& depositor) const {
  return get(token, depositor).total();
}

gateway::schema::amount_t balances::available(
    const gateway::schema::address_t& token,
    const gateway::schema::address_t& depositor) const {
  return get(token, depositor).available;
}

gateway::schema::amount_t balances::withdrawing(
    const gateway::schema::address_t& token,
    const gateway::schema::address_t& depositor) const {
  return get(token, depositor).withdrawing;
}

gateway::schema::amount_t balances::withdrawable(
    const gateway::schema::address_t& token,
    const gateway::schema::address_t& depositor,
    const gateway::schema::block_height_t current_block) const {
  auto entry = get(token, depositor);
  if (entry.withdrawing == 0 || current_block < entry.withdrawable_at) {
    return 0;
  }
  return entry.withdrawing;
}

gateway::schema::block_height_t balances::withdrawal_block(
    const gateway::schema::address_t& token,
    const gateway::schema::address_t& depositor) const {
  return get(token, depositor).withdrawable_at;
}

void balances::increase_available(const gateway::schema::address_t& token,
                                  const gateway::schema::address_t& depositor,
                                  const gateway::schema::amount_t& value) {
  static const auto kMax =
      std::numeric_limits<gateway::schema::amount_t>::max();
  auto entry = get(token, depositor);
  if (value > kMax - entry.total()) {
    throw gateway::schema::error{
        gateway::schema::error_code::balance_overflow,
        {gateway::schema::make_detail("value", value.str())}};
  }
  entry.available += value;
  put(token, depositor, entry);
}

void balances::move_to_withdrawing(
    const gateway::schema::address_t& token,
    const gateway::schema::address_t& depositor,
    const gateway::schema::amount_t& value,
    const gateway::schema::block_height_t withdrawable_at) {
  auto entry = get(token, depositor);
  if (entry.available < value) {
    throw gateway::schema::error{
        gateway::schema::error_code::insufficient_available_balance,
        {gateway::schema::make_detail("available", entry.available.str()),
         gateway::schema::make_detail("value", value.str())}};
  }
  entry.available -= value;
  entry.withdrawing += value;
  entry.withdrawable_at = withdrawable_at;
  put(token, depositor, entry);
}

gateway::schema::amount_t balances::empty_withdrawing(
    const gateway::schema::address_t& token,
    const gateway::schema::address_t& depositor) {
  auto entry = get(token, depositor);
  if (entry.withdrawing == 0) {
    throw gateway::schema::error{
        gateway::schema::error_code::no_withdrawing_balance};
  }
  auto withdrawn = entry.withdrawing;
  entry.withdrawing = 0;
  entry.withdrawable_at = 0;
  put(token, depositor, entry);
  return withdrawn;
}

reduction balances::reduce_balance(const gateway::schema::address_t& token,
                                   const gateway::schema::address_t& depositor,
                                   const gateway::schema::amount_t& value) {
  auto entry = get(token, depositor);
  auto out = reduction{};
  out.from_available = std::min(entry.available, value);
  auto remaining = gateway::schema::amount_t{value - out.from_available};
  out.from_withdrawing = std::min(entry.withdrawing, remaining);
  entry.available -= out.from_available;
  entry.withdrawing -= out.from_withdrawing;
  if (entry.withdrawing == 0) {
    entry.withdrawable_at = 0;
  }
  put(token, depositor, entry);
  return out;
}

}  // namespace gateway::ledger
