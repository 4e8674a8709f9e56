#pragma once

#include <gateway/schema/error.hpp>
#include <gateway/schema/primitives.hpp>

#include <boost/endian/conversion.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>

namespace gateway::transfer::detail {

/// Every read is bounds checked, a view that was never validated still
/// cannot read past its buffer.
inline void require(const gateway::schema::bytes_view_t& data,
                    const std::size_t offset,
                    const std::size_t size) {
  if (offset > data.size() || size > data.size() - offset) {
    throw gateway::schema::error{gateway::schema::error_code::data_too_short};
  }
}

inline uint32_t read_u32(const gateway::schema::bytes_view_t& data,
                         const std::size_t offset) {
  require(data, offset, 4);
  return boost::endian::load_big_u32(data.data() + offset);
}

inline gateway::schema::hash32_t read_word(
    const gateway::schema::bytes_view_t& data,
    const std::size_t offset) {
  require(data, offset, 32);
  auto word = gateway::schema::hash32_t{};
  std::copy_n(data.data() + offset, word.size(), word.begin());
  return word;
}

inline gateway::schema::amount_t read_amount(
    const gateway::schema::bytes_view_t& data,
    const std::size_t offset) {
  return gateway::schema::make_amount(read_word(data, offset));
}

inline gateway::schema::bytes_view_t read_slice(
    const gateway::schema::bytes_view_t& data,
    const std::size_t offset,
    const std::size_t size) {
  require(data, offset, size);
  return data.subspan(offset, size);
}

inline void write_u32(gateway::schema::bytes_t& out, const uint32_t value) {
  auto buffer = std::array<uint8_t, 4>{};
  boost::endian::store_big_u32(buffer.data(), value);
  out.insert(out.end(), buffer.begin(), buffer.end());
}

inline void write_word(gateway::schema::bytes_t& out,
                       const gateway::schema::hash32_t& word) {
  out.insert(out.end(), word.begin(), word.end());
}

inline void write_amount(gateway::schema::bytes_t& out,
                         const gateway::schema::amount_t& value) {
  write_word(out, gateway::schema::make_word(value));
}

/// The magic of any payload, without validating anything else.
inline uint32_t peek_magic(const gateway::schema::bytes_view_t& data) {
  if (data.size() < 4) {
    throw gateway::schema::error{gateway::schema::error_code::data_too_short};
  }
  return boost::endian::load_big_u32(data.data());
}

}  // namespace gateway::transfer::detail
