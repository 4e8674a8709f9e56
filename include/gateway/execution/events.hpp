#pragma once

#include <gateway/schema/primitives.hpp>
#include <gateway/schema/transaction_event.hpp>
#include <gateway/schema/transaction_event_attribute.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace gateway::execution {

gateway::schema::transaction_event_t make_event(
    std::string_view type,
    std::vector<gateway::schema::transaction_event_attribute_t> attributes);

/// 0x-prefixed hex.
gateway::schema::transaction_event_attribute_t make_attribute(
    std::string_view key,
    const gateway::schema::hash32_t& value,
    bool index = false);
/// Decimal.
gateway::schema::transaction_event_attribute_t make_attribute(
    std::string_view key,
    const gateway::schema::amount_t& value,
    bool index = false);
gateway::schema::transaction_event_attribute_t make_attribute(
    std::string_view key,
    uint64_t value,
    bool index = false);

/// Value of the first attribute named key, or empty.
std::string find_attribute(const gateway::schema::transaction_event_t& event,
                           std::string_view key);

}  // namespace gateway::execution
