#pragma once

#include <gateway/schema/error.hpp>
#include <gateway/schema/primitives.hpp>
#include <gateway/transfer/attestation.hpp>
#include <gateway/transfer/burn_intent.hpp>
#include <gateway/transfer/detail/bytes.hpp>
#include <gateway/transfer/detail/payload.hpp>
#include <gateway/transfer/layout.hpp>
#include <gateway/transfer/typed_data.hpp>

#include <string>
#include <vector>

namespace gateway::transfer {

struct burn_intent_set_traits final {
  using element_t = burn_intent;
  using element_view_t = burn_intent_view;
  static constexpr uint32_t kSetMagic = layout::kBurnIntentSetMagic;
  static constexpr uint32_t kSetVersion = layout::kBurnIntentSetVersion;
  static const gateway::schema::hash32_t& set_type_hash() {
    return typed_data::burn_intent_set_type_hash();
  }
};

struct attestation_set_traits final {
  using element_t = attestation;
  using element_view_t = attestation_view;
  static constexpr uint32_t kSetMagic = layout::kAttestationSetMagic;
  static constexpr uint32_t kSetVersion = layout::kAttestationSetVersion;
  static const gateway::schema::hash32_t& set_type_hash() {
    return typed_data::attestation_set_type_hash();
  }
};

namespace detail {

/// Declared length of the element starting at offset: its own header plus
/// the TransferSpec length it carries. Requires the element header to fit.
template <typename ElementView>
uint64_t element_length(const gateway::schema::bytes_view_t& data,
                        const std::size_t offset) {
  return static_cast<uint64_t>(ElementView::kHeaderLength) +
         read_u32(data, offset + ElementView::kTransferSpecLengthOffset);
}

}  // namespace detail

/// Zero-copy view over a packed set of payloads. validate() checks the outer
/// framing only; elements are validated as they are iterated.
template <typename Traits>
class payload_set_view final {
 public:
  using element_view_t = typename Traits::element_view_t;

  static payload_set_view cast(const gateway::schema::bytes_view_t& data) {
    detail::check_magic(data, Traits::kSetMagic);
    return payload_set_view{data};
  }

  void validate() const {
    namespace offsets = layout::payload_set;
    using gateway::schema::error;
    using gateway::schema::error_code;

    detail::check_header(data_, offsets::kHeaderLength, Traits::kSetVersion);
    auto count = num_elements();
    auto offset = static_cast<uint64_t>(offsets::kElements);
    for (uint32_t index = 0; index < count; ++index) {
      auto remaining = data_.size() - offset;
      if (remaining < element_view_t::kHeaderLength) {
        throw error{error_code::element_header_too_short, index};
      }
      auto length = detail::element_length<element_view_t>(
          data_, static_cast<std::size_t>(offset));
      if (remaining < length) {
        throw error{error_code::element_too_short,
                    index,
                    {gateway::schema::make_detail("length",
                                                  std::to_string(length)),
                     gateway::schema::make_detail(
                         "remaining", std::to_string(remaining))}};
      }
      if (detail::read_u32(data_, static_cast<std::size_t>(offset)) !=
          element_view_t::kMagic) {
        throw error{error_code::invalid_element_magic, index};
      }
      offset += length;
    }
    if (offset != data_.size()) {
      throw error{error_code::overall_length_mismatch,
                  {gateway::schema::make_detail("expected",
                                                std::to_string(offset)),
                   gateway::schema::make_detail(
                       "actual", std::to_string(data_.size()))}};
    }
  }

  gateway::schema::bytes_view_t bytes() const { return data_; }

  uint32_t version() const {
    return detail::read_u32(data_, layout::payload_set::kVersion);
  }

  uint32_t num_elements() const {
    return detail::read_u32(data_, layout::payload_set::kNumElements);
  }

 private:
  explicit payload_set_view(const gateway::schema::bytes_view_t& data)
      : data_{data} {}

  gateway::schema::bytes_view_t data_;
};

using burn_intent_set_view = payload_set_view<burn_intent_set_traits>;
using attestation_set_view = payload_set_view<attestation_set_traits>;

/// Pack already encoded elements behind a set header.
template <typename Traits>
gateway::schema::bytes_t encode_set(
    const std::vector<gateway::schema::bytes_t>& elements) {
  if (elements.size() > layout::kMaxLength32) {
    throw gateway::schema::error{
        gateway::schema::error_code::too_many_elements,
        {gateway::schema::make_detail("count",
                                      std::to_string(elements.size()))}};
  }
  auto out = gateway::schema::bytes_t{};
  detail::write_u32(out, Traits::kSetMagic);
  detail::write_u32(out, Traits::kSetVersion);
  detail::write_u32(out, static_cast<uint32_t>(elements.size()));
  for (const auto& element : elements) {
    out.insert(out.end(), element.begin(), element.end());
  }
  return out;
}

template <typename Traits>
gateway::schema::bytes_t encode_set(
    const std::vector<typename Traits::element_t>& elements) {
  auto encoded = std::vector<gateway::schema::bytes_t>{};
  encoded.reserve(elements.size());
  for (const auto& element : elements) {
    encoded.push_back(encode(element));
  }
  return encode_set<Traits>(encoded);
}

}  // namespace gateway::transfer
