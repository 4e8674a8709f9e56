#pragma once
#include <gateway/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace gateway::schema::key {

struct builder final {
  gateway::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);
  builder& write(const gateway::schema::hash32_t& word);
};

}  // namespace gateway::schema::key
