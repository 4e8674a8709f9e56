#pragma once

#include <gateway/schema/error.hpp>
#include <gateway/schema/transaction_event.hpp>
#include <gateway/schema/transaction_result.hpp>
#include <gateway/state/overlay.hpp>

#include <spdlog/spdlog.h>

#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gateway::execution::detail {

using events_t = std::vector<gateway::schema::transaction_event_t>;

inline gateway::schema::transaction_result_t make_error_result(
    const gateway::schema::error& failure,
    const std::string_view codespace) {
  auto result = gateway::schema::transaction_result_t{};
  result.code = static_cast<uint32_t>(failure.code());
  result.log = std::string{gateway::schema::to_string(failure.code())};
  result.info = failure.info();
  result.codespace = std::string{codespace};
  return result;
}

/// Run one state transition against a fresh overlay. The operation either
/// completes and all its writes are committed in one batch, or it throws a
/// gateway::schema::error and nothing it wrote is kept.
template <typename Operation>
gateway::schema::transaction_result_t run_transaction(
    std::mutex& mutex,
    gateway::state::overlay::encoder_t& encoder,
    gateway::state::overlay::storage_t& storage,
    const std::string_view codespace,
    const std::string_view name,
    Operation&& operation) {
  auto lock = std::scoped_lock{mutex};
  auto state = gateway::state::overlay{encoder, storage};
  auto events = events_t{};
  try {
    operation(state, events);
  } catch (const gateway::schema::error& failure) {
    state.discard();
    spdlog::warn("Rejected {}.{}: {}", codespace, name, failure.what());
    return make_error_result(failure, codespace);
  }
  state.commit();
  spdlog::info("Committed {}.{} with {} event(s)", codespace, name,
               events.size());

  auto result = gateway::schema::transaction_result_t{};
  result.codespace = std::string{codespace};
  result.events = std::move(events);
  return result;
}

/// Read-only access under the engine lock. Writes are never committed.
template <typename Query>
auto run_query(std::mutex& mutex,
               gateway::state::overlay::encoder_t& encoder,
               gateway::state::overlay::storage_t& storage,
               Query&& query) {
  auto lock = std::scoped_lock{mutex};
  auto state = gateway::state::overlay{encoder, storage};
  return query(state);
}

}  // namespace gateway::execution::detail
