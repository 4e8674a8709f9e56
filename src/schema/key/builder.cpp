#include <algorithm>
#include <gateway/schema/key/builder.hpp>
#include <iterator>
#include <ranges>

using namespace gateway::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const gateway::schema::hash32_t& word) {
  return write(std::span<const uint8_t>{word.data(), word.size()});
}
