#pragma once

#include <gateway/execution/call_context.hpp>
#include <gateway/execution/token_operations.hpp>
#include <gateway/schema/encoding/scale/encoder.hpp>
#include <gateway/schema/primitives.hpp>
#include <gateway/schema/transaction_result.hpp>
#include <gateway/storage/rocksdb/storage.hpp>
#include <gateway/transfer/typed_data.hpp>

#include <mutex>
#include <string_view>
#include <vector>

namespace gateway::execution {

inline constexpr std::string_view kMinterCodespace{"gateway.minter"};

struct minter_options final {
  gateway::schema::domain_t domain{};
  gateway::schema::address_t contract{};
  gateway::transfer::typed_data::domain eip712{
      gateway::transfer::typed_data::minter_domain()};
  /// Seeded into state when the minter starts.
  std::vector<gateway::schema::address_t> tokens;
  std::vector<gateway::schema::address_t> attestation_signers;
};

/// Destination-side contract: mints against attestations signed by an
/// attestation signer, each TransferSpec at most once.
class minter final {
 public:
  minter(gateway::schema::encoding::scale_encoder_t& encoder,
         gateway::storage::rocksdb_storage_t& storage,
         minter_options options,
         token_operations tokens);

  /// Mint for every attestation addressed to this domain in an encoded
  /// Attestation or AttestationSet.
  gateway::schema::transaction_result_t mint(
      const call_context& ctx,
      const gateway::schema::bytes_view_t& attestations,
      const gateway::schema::signature_t& signature);

  gateway::schema::transaction_result_t add_supported_token(
      const gateway::schema::address_t& token);
  gateway::schema::transaction_result_t add_attestation_signer(
      const gateway::schema::address_t& signer);
  gateway::schema::transaction_result_t remove_attestation_signer(
      const gateway::schema::address_t& signer);

  bool is_token_supported(const gateway::schema::address_t& token);
  bool is_attestation_signer(const gateway::schema::address_t& signer);
  bool is_transfer_spec_used(const gateway::schema::hash32_t& hash);

  const gateway::schema::hash32_t& domain_separator() const {
    return domain_separator_;
  }

 private:
  gateway::schema::encoding::scale_encoder_t& encoder_;
  gateway::storage::rocksdb_storage_t& storage_;
  minter_options options_;
  token_operations tokens_;
  gateway::schema::hash32_t domain_separator_;
  std::mutex mutex_;
};

}  // namespace gateway::execution
