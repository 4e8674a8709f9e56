#include <gateway/crypto/keccak.hpp>
#include <gateway/transfer/burn_intent.hpp>
#include <gateway/transfer/detail/payload.hpp>
#include <gateway/transfer/typed_data.hpp>

namespace gateway::transfer {

namespace offsets = layout::burn_intent;

void encode(const burn_intent& intent, gateway::schema::bytes_t& out) {
  auto spec = encode(intent.spec);
  detail::write_u32(out, layout::kBurnIntentMagic);
  detail::write_u32(out, intent.version);
  detail::write_amount(out, intent.max_block_height);
  detail::write_amount(out, intent.max_fee);
  detail::write_u32(out, static_cast<uint32_t>(spec.size()));
  out.insert(out.end(), spec.begin(), spec.end());
}

gateway::schema::bytes_t encode(const burn_intent& intent) {
  auto out = gateway::schema::bytes_t{};
  encode(intent, out);
  return out;
}

burn_intent_view burn_intent_view::cast(
    const gateway::schema::bytes_view_t& data) {
  detail::check_magic(data, kMagic);
  return burn_intent_view{data};
}

void burn_intent_view::validate() const {
  detail::check_header(data_, kHeaderLength, layout::kBurnIntentVersion);
  detail::check_embedded_spec(data_, kHeaderLength, kTransferSpecLengthOffset);
}

uint32_t burn_intent_view::version() const {
  return detail::read_u32(data_, offsets::kVersion);
}

gateway::schema::amount_t burn_intent_view::max_block_height() const {
  return detail::read_amount(data_, offsets::kMaxBlockHeight);
}

gateway::schema::amount_t burn_intent_view::max_fee() const {
  return detail::read_amount(data_, offsets::kMaxFee);
}

uint32_t burn_intent_view::transfer_spec_length() const {
  return detail::read_u32(data_, offsets::kTransferSpecLength);
}

transfer_spec_view burn_intent_view::spec() const {
  detail::require(data_, offsets::kTransferSpec, 0);
  return transfer_spec_view::cast(data_.subspan(offsets::kTransferSpec));
}

gateway::schema::hash32_t burn_intent_view::typed_data_hash() const {
  return gateway::crypto::keccak256_hasher{}
      .update(typed_data::burn_intent_type_hash())
      .update(detail::read_word(data_, offsets::kMaxBlockHeight))
      .update(detail::read_word(data_, offsets::kMaxFee))
      .update(spec().typed_data_hash())
      .finalize();
}

burn_intent burn_intent_view::decode() const {
  return burn_intent{.version = version(),
                     .max_block_height = max_block_height(),
                     .max_fee = max_fee(),
                     .spec = spec().decode()};
}

}  // namespace gateway::transfer
