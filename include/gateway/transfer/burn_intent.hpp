#pragma once

#include <gateway/schema/primitives.hpp>
#include <gateway/transfer/transfer_spec.hpp>

namespace gateway::transfer {

/// Source-side authorization to burn up to spec.value + max_fee, valid while
/// the current block is at most max_block_height.
struct burn_intent final {
  uint32_t version{layout::kBurnIntentVersion};
  gateway::schema::amount_t max_block_height{};
  gateway::schema::amount_t max_fee{};
  transfer_spec spec;
};

gateway::schema::bytes_t encode(const burn_intent& intent);
void encode(const burn_intent& intent, gateway::schema::bytes_t& out);

class burn_intent_view final {
 public:
  static constexpr uint32_t kMagic = layout::kBurnIntentMagic;
  static constexpr std::size_t kHeaderLength =
      layout::burn_intent::kHeaderLength;
  static constexpr std::size_t kTransferSpecLengthOffset =
      layout::burn_intent::kTransferSpecLength;

  static burn_intent_view cast(const gateway::schema::bytes_view_t& data);

  /// Header, version, embedded TransferSpec and the wrapper length
  /// invariants.
  void validate() const;

  gateway::schema::bytes_view_t bytes() const { return data_; }

  uint32_t version() const;
  gateway::schema::amount_t max_block_height() const;
  gateway::schema::amount_t max_fee() const;
  uint32_t transfer_spec_length() const;
  /// Cast (not validated) view of everything after the header.
  transfer_spec_view spec() const;

  gateway::schema::hash32_t typed_data_hash() const;
  burn_intent decode() const;

 private:
  explicit burn_intent_view(const gateway::schema::bytes_view_t& data)
      : data_{data} {}

  gateway::schema::bytes_view_t data_;
};

}  // namespace gateway::transfer
