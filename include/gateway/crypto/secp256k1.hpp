#pragma once

#include <gateway/schema/primitives.hpp>
#include <optional>

namespace gateway::crypto {

bool available();

/// Recover the signer of a 32-byte digest from an [r || s || v] signature.
/// Returns the signer's EVM address left-padded to 32 bytes, or std::nullopt
/// for malformed, high-s or unrecoverable signatures.
std::optional<gateway::schema::address_t> recover_address(
    const gateway::schema::hash32_t& digest,
    const gateway::schema::signature_t& signature);

std::optional<gateway::schema::address_t> address_from_private_key(
    const gateway::schema::private_key_t& private_key);

/// ECDSA (random nonce) over the digest, normalized to low-s, with
/// v in {27, 28}.
std::optional<gateway::schema::signature_t> sign_digest(
    const gateway::schema::hash32_t& digest,
    const gateway::schema::private_key_t& private_key);

/// keccak256("\x19Ethereum Signed Message:\n32" || message_hash)
gateway::schema::hash32_t eth_signed_message_hash(
    const gateway::schema::hash32_t& message_hash);

}  // namespace gateway::crypto
