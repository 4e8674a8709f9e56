#pragma once

#include <gateway/schema/primitives.hpp>

#include <string>
#include <string_view>
#include <vector>

// EIP-712 structured data hashing for the transfer payloads.
namespace gateway::transfer::typed_data {

inline constexpr std::string_view kDomainType{
    "EIP712Domain(string name,string version)"};

inline constexpr std::string_view kTransferSpecType{
    "TransferSpec(uint32 version,uint32 sourceDomain,uint32 destinationDomain,"
    "bytes32 sourceContract,bytes32 destinationContract,bytes32 sourceToken,"
    "bytes32 destinationToken,bytes32 sourceDepositor,"
    "bytes32 destinationRecipient,bytes32 sourceSigner,"
    "bytes32 destinationCaller,uint256 value,bytes32 salt,bytes hookData)"};

inline constexpr std::string_view kBurnIntentPrimaryType{
    "BurnIntent(uint256 maxBlockHeight,uint256 maxFee,TransferSpec spec)"};

inline constexpr std::string_view kAttestationPrimaryType{
    "Attestation(TransferSpec spec)"};

inline constexpr std::string_view kBurnIntentSetPrimaryType{
    "BurnIntentSet(BurnIntent[] intents)"};

inline constexpr std::string_view kAttestationSetPrimaryType{
    "AttestationSet(Attestation[] attestations)"};

/// Full encodeType strings: primary type followed by the referenced types in
/// alphabetical order.
const std::string& burn_intent_type();
const std::string& attestation_type();
const std::string& burn_intent_set_type();
const std::string& attestation_set_type();

// Computed once on first use.
const gateway::schema::hash32_t& domain_type_hash();
const gateway::schema::hash32_t& transfer_spec_type_hash();
const gateway::schema::hash32_t& burn_intent_type_hash();
const gateway::schema::hash32_t& attestation_type_hash();
const gateway::schema::hash32_t& burn_intent_set_type_hash();
const gateway::schema::hash32_t& attestation_set_type_hash();

struct domain final {
  std::string name;
  std::string version;
};

domain wallet_domain();
domain minter_domain();

gateway::schema::hash32_t domain_separator(const domain& value);

/// keccak256(0x1901 || domain_separator || struct_hash)
gateway::schema::hash32_t digest(
    const gateway::schema::hash32_t& domain_separator,
    const gateway::schema::hash32_t& struct_hash);

/// keccak256(type_hash || keccak256(element_0 || ... || element_n-1))
gateway::schema::hash32_t array_struct_hash(
    const gateway::schema::hash32_t& type_hash,
    const std::vector<gateway::schema::hash32_t>& element_hashes);

}  // namespace gateway::transfer::typed_data
