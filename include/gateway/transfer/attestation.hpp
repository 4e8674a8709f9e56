#pragma once

#include <gateway/schema/primitives.hpp>
#include <gateway/transfer/transfer_spec.hpp>

namespace gateway::transfer {

/// Destination-side authorization to mint spec.value.
struct attestation final {
  uint32_t version{layout::kAttestationVersion};
  transfer_spec spec;
};

gateway::schema::bytes_t encode(const attestation& value);
void encode(const attestation& value, gateway::schema::bytes_t& out);

class attestation_view final {
 public:
  static constexpr uint32_t kMagic = layout::kAttestationMagic;
  static constexpr std::size_t kHeaderLength =
      layout::attestation::kHeaderLength;
  static constexpr std::size_t kTransferSpecLengthOffset =
      layout::attestation::kTransferSpecLength;

  static attestation_view cast(const gateway::schema::bytes_view_t& data);
  void validate() const;

  gateway::schema::bytes_view_t bytes() const { return data_; }

  uint32_t version() const;
  uint32_t transfer_spec_length() const;
  transfer_spec_view spec() const;

  gateway::schema::hash32_t typed_data_hash() const;
  attestation decode() const;

 private:
  explicit attestation_view(const gateway::schema::bytes_view_t& data)
      : data_{data} {}

  gateway::schema::bytes_view_t data_;
};

}  // namespace gateway::transfer
