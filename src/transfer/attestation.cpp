#include <gateway/crypto/keccak.hpp>
#include <gateway/transfer/attestation.hpp>
#include <gateway/transfer/detail/payload.hpp>
#include <gateway/transfer/typed_data.hpp>

namespace gateway::transfer {

namespace offsets = layout::attestation;

void encode(const attestation& value, gateway::schema::bytes_t& out) {
  auto spec = encode(value.spec);
  detail::write_u32(out, layout::kAttestationMagic);
  detail::write_u32(out, value.version);
  detail::write_u32(out, static_cast<uint32_t>(spec.size()));
  out.insert(out.end(), spec.begin(), spec.end());
}

gateway::schema::bytes_t encode(const attestation& value) {
  auto out = gateway::schema::bytes_t{};
  encode(value, out);
  return out;
}

attestation_view attestation_view::cast(
    const gateway::schema::bytes_view_t& data) {
  detail::check_magic(data, kMagic);
  return attestation_view{data};
}

void attestation_view::validate() const {
  detail::check_header(data_, kHeaderLength, layout::kAttestationVersion);
  detail::check_embedded_spec(data_, kHeaderLength, kTransferSpecLengthOffset);
}

uint32_t attestation_view::version() const {
  return detail::read_u32(data_, offsets::kVersion);
}

uint32_t attestation_view::transfer_spec_length() const {
  return detail::read_u32(data_, offsets::kTransferSpecLength);
}

transfer_spec_view attestation_view::spec() const {
  detail::require(data_, offsets::kTransferSpec, 0);
  return transfer_spec_view::cast(data_.subspan(offsets::kTransferSpec));
}

gateway::schema::hash32_t attestation_view::typed_data_hash() const {
  return gateway::crypto::keccak256_hasher{}
      .update(typed_data::attestation_type_hash())
      .update(spec().typed_data_hash())
      .finalize();
}

attestation attestation_view::decode() const {
  return attestation{.version = version(), .spec = spec().decode()};
}

}  // namespace gateway::transfer
