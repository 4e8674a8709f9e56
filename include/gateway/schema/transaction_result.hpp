#pragma once

#include <gateway/schema/primitives.hpp>
#include <gateway/schema/transaction_event.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace gateway::schema {

template <uint16_t Version>
struct transaction_result;

/// Outcome of one engine call. code == 0 means committed; otherwise code is
/// an error_code, log its name, info the rendered detail attributes.
template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<transaction_event_t> events;
};

using transaction_result_t = transaction_result<1>;

}  // namespace gateway::schema
