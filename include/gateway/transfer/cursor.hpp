#pragma once

#include <gateway/schema/error.hpp>
#include <gateway/schema/primitives.hpp>
#include <gateway/transfer/detail/bytes.hpp>
#include <gateway/transfer/payload_set.hpp>
#include <gateway/transfer/typed_data.hpp>

#include <spdlog/fmt/fmt.h>

#include <vector>

namespace gateway::transfer {

/// Forward-only, single pass iteration over the elements of a set (or over
/// a single payload, as a set of one). Each next() structurally validates
/// the element it returns.
template <typename Traits>
class cursor final {
 public:
  using element_view_t = typename Traits::element_view_t;

  /// Performs the full outer validation of the set.
  explicit cursor(const payload_set_view<Traits>& set)
      : data_{set.bytes()}, offset_{layout::payload_set::kElements} {
    set.validate();
    num_elements_ = set.num_elements();
    done_ = num_elements_ == 0;
  }

  explicit cursor(const element_view_t& single)
      : data_{single.bytes()}, num_elements_{1} {}

  element_view_t next() {
    if (done_) {
      throw gateway::schema::error{
          gateway::schema::error_code::cursor_out_of_bounds,
          {gateway::schema::make_detail("index", std::to_string(index_)),
           gateway::schema::make_detail("size",
                                        std::to_string(num_elements_))}};
    }
    auto length = detail::element_length<element_view_t>(data_, offset_);
    auto element = element_view_t::cast(
        detail::read_slice(data_, offset_, static_cast<std::size_t>(length)));
    element.validate();
    offset_ += static_cast<std::size_t>(length);
    ++index_;
    done_ = index_ == num_elements_;
    return element;
  }

  bool done() const { return done_; }
  uint32_t index() const { return index_; }
  uint32_t size() const { return num_elements_; }

 private:
  gateway::schema::bytes_view_t data_;
  std::size_t offset_{};
  uint32_t index_{};
  uint32_t num_elements_{};
  bool done_{};
};

/// Either a single payload or a set of them, told apart by magic.
template <typename Traits>
class payload final {
 public:
  using element_view_t = typename Traits::element_view_t;

  static payload parse(const gateway::schema::bytes_view_t& data) {
    auto magic = detail::peek_magic(data);
    if (magic == Traits::kSetMagic) {
      auto set = payload_set_view<Traits>::cast(data);
      set.validate();
      return payload{data, true};
    }
    if (magic == element_view_t::kMagic) {
      element_view_t::cast(data).validate();
      return payload{data, false};
    }
    throw gateway::schema::error{
        gateway::schema::error_code::invalid_magic,
        {gateway::schema::make_detail(
             "expected",
             fmt::format("0x{:08x}|0x{:08x}", element_view_t::kMagic,
                         Traits::kSetMagic)),
         gateway::schema::make_detail("actual",
                                      fmt::format("0x{:08x}", magic))}};
  }

  bool is_set() const { return is_set_; }
  gateway::schema::bytes_view_t bytes() const { return data_; }

  cursor<Traits> elements() const {
    if (is_set_) {
      return cursor<Traits>{payload_set_view<Traits>::cast(data_)};
    }
    return cursor<Traits>{element_view_t::cast(data_)};
  }

  /// EIP-712 struct hash of whatever was signed: the element itself, or
  /// the set over the struct hashes of its elements.
  gateway::schema::hash32_t typed_data_hash() const {
    if (!is_set_) {
      return element_view_t::cast(data_).typed_data_hash();
    }
    auto hashes = std::vector<gateway::schema::hash32_t>{};
    auto it = elements();
    hashes.reserve(it.size());
    while (!it.done()) {
      hashes.push_back(it.next().typed_data_hash());
    }
    return typed_data::array_struct_hash(Traits::set_type_hash(), hashes);
  }

 private:
  payload(const gateway::schema::bytes_view_t& data, const bool is_set)
      : data_{data}, is_set_{is_set} {}

  gateway::schema::bytes_view_t data_;
  bool is_set_{};
};

using burn_intent_cursor = cursor<burn_intent_set_traits>;
using attestation_cursor = cursor<attestation_set_traits>;
using burn_intent_payload = payload<burn_intent_set_traits>;
using attestation_payload = payload<attestation_set_traits>;

}  // namespace gateway::transfer
