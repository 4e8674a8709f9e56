#include <gateway/crypto/keccak.hpp>
#include <gateway/crypto/secp256k1.hpp>
#include <gateway/execution/burn_batch.hpp>
#include <gateway/schema/encoding/scale/encoder.hpp>

namespace gateway::execution {

gateway::schema::bytes_t encode_burn_batch(const burn_batch_t& batch) {
  auto encoder = gateway::schema::encoding::scale_encoder_t{};
  return encoder.encode(batch);
}

std::optional<burn_batch_t> try_decode_burn_batch(
    const gateway::schema::bytes_view_t& bytes) {
  auto encoder = gateway::schema::encoding::scale_encoder_t{};
  return encoder.try_decode<burn_batch_t>(bytes);
}

gateway::schema::hash32_t burn_batch_digest(
    const gateway::schema::bytes_view_t& batch_bytes) {
  return gateway::crypto::eth_signed_message_hash(
      gateway::crypto::keccak256(batch_bytes));
}

}  // namespace gateway::execution
