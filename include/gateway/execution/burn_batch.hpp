#pragma once

#include <gateway/schema/primitives.hpp>

#include <optional>
#include <tuple>
#include <vector>

namespace gateway::execution {

/// (encoded BurnIntent or BurnIntentSet, 65-byte signature, one fee word
/// per intent)
using burn_batch_entry_t =
    std::tuple<gateway::schema::bytes_t,
               gateway::schema::bytes_t,
               std::vector<gateway::schema::word_t>>;
using burn_batch_t = std::vector<burn_batch_entry_t>;

/// SCALE encoding of the batch; these are the bytes the burn signer signs.
gateway::schema::bytes_t encode_burn_batch(const burn_batch_t& batch);
std::optional<burn_batch_t> try_decode_burn_batch(
    const gateway::schema::bytes_view_t& bytes);

/// keccak256("\x19Ethereum Signed Message:\n32" || keccak256(batch_bytes))
gateway::schema::hash32_t burn_batch_digest(
    const gateway::schema::bytes_view_t& batch_bytes);

}  // namespace gateway::execution
