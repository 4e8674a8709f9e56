#include <gateway/execution/events.hpp>

#include <string>
#include <utility>

namespace gateway::execution {

gateway::schema::transaction_event_t make_event(
    const std::string_view type,
    std::vector<gateway::schema::transaction_event_attribute_t> attributes) {
  return gateway::schema::transaction_event_t{
      .type = std::string{type}, .attributes = std::move(attributes)};
}

gateway::schema::transaction_event_attribute_t make_attribute(
    const std::string_view key,
    const gateway::schema::hash32_t& value,
    const bool index) {
  return gateway::schema::transaction_event_attribute_t{
      .key = std::string{key},
      .value = "0x" + gateway::schema::to_hex(value),
      .index = index};
}

gateway::schema::transaction_event_attribute_t make_attribute(
    const std::string_view key,
    const gateway::schema::amount_t& value,
    const bool index) {
  return gateway::schema::transaction_event_attribute_t{
      .key = std::string{key}, .value = value.str(), .index = index};
}

gateway::schema::transaction_event_attribute_t make_attribute(
    const std::string_view key,
    const uint64_t value,
    const bool index) {
  return gateway::schema::transaction_event_attribute_t{
      .key = std::string{key}, .value = std::to_string(value), .index = index};
}

std::string find_attribute(const gateway::schema::transaction_event_t& event,
                           const std::string_view key) {
  for (const auto& attribute : event.attributes) {
    if (attribute.key == key) {
      return attribute.value;
    }
  }
  return {};
}

}  // namespace gateway::execution
