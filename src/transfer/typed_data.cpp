#include <gateway/crypto/keccak.hpp>
#include <gateway/transfer/typed_data.hpp>

#include <array>

namespace gateway::transfer::typed_data {

const std::string& burn_intent_type() {
  static const auto type =
      std::string{kBurnIntentPrimaryType} + std::string{kTransferSpecType};
  return type;
}

const std::string& attestation_type() {
  static const auto type =
      std::string{kAttestationPrimaryType} + std::string{kTransferSpecType};
  return type;
}

const std::string& burn_intent_set_type() {
  static const auto type = std::string{kBurnIntentSetPrimaryType} +
                           std::string{kBurnIntentPrimaryType} +
                           std::string{kTransferSpecType};
  return type;
}

const std::string& attestation_set_type() {
  static const auto type = std::string{kAttestationSetPrimaryType} +
                           std::string{kAttestationPrimaryType} +
                           std::string{kTransferSpecType};
  return type;
}

const gateway::schema::hash32_t& domain_type_hash() {
  static const auto hash = gateway::crypto::keccak256(kDomainType);
  return hash;
}

const gateway::schema::hash32_t& transfer_spec_type_hash() {
  static const auto hash = gateway::crypto::keccak256(kTransferSpecType);
  return hash;
}

const gateway::schema::hash32_t& burn_intent_type_hash() {
  static const auto hash = gateway::crypto::keccak256(burn_intent_type());
  return hash;
}

const gateway::schema::hash32_t& attestation_type_hash() {
  static const auto hash = gateway::crypto::keccak256(attestation_type());
  return hash;
}

const gateway::schema::hash32_t& burn_intent_set_type_hash() {
  static const auto hash = gateway::crypto::keccak256(burn_intent_set_type());
  return hash;
}

const gateway::schema::hash32_t& attestation_set_type_hash() {
  static const auto hash = gateway::crypto::keccak256(attestation_set_type());
  return hash;
}

domain wallet_domain() {
  return domain{.name = "GatewayWallet", .version = "1"};
}

domain minter_domain() {
  return domain{.name = "GatewayMinter", .version = "1"};
}

gateway::schema::hash32_t domain_separator(const domain& value) {
  return gateway::crypto::keccak256_hasher{}
      .update(domain_type_hash())
      .update(gateway::crypto::keccak256(value.name))
      .update(gateway::crypto::keccak256(value.version))
      .finalize();
}

gateway::schema::hash32_t digest(
    const gateway::schema::hash32_t& domain_separator,
    const gateway::schema::hash32_t& struct_hash) {
  static constexpr auto kPrefix = std::array<uint8_t, 2>{0x19, 0x01};
  return gateway::crypto::keccak256_hasher{}
      .update(gateway::schema::bytes_view_t{kPrefix.data(), kPrefix.size()})
      .update(domain_separator)
      .update(struct_hash)
      .finalize();
}

gateway::schema::hash32_t array_struct_hash(
    const gateway::schema::hash32_t& type_hash,
    const std::vector<gateway::schema::hash32_t>& element_hashes) {
  auto elements = gateway::crypto::keccak256_hasher{};
  for (const auto& hash : element_hashes) {
    elements.update(hash);
  }
  return gateway::crypto::keccak256_hasher{}
      .update(type_hash)
      .update(elements.finalize())
      .finalize();
}

}  // namespace gateway::transfer::typed_data
