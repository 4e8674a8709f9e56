#pragma once

#include <gateway/execution/call_context.hpp>
#include <gateway/execution/token_operations.hpp>
#include <gateway/schema/encoding/scale/encoder.hpp>
#include <gateway/schema/primitives.hpp>
#include <gateway/schema/transaction_result.hpp>
#include <gateway/storage/rocksdb/storage.hpp>
#include <gateway/transfer/typed_data.hpp>

#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace gateway::execution {

inline constexpr std::string_view kWalletCodespace{"gateway.wallet"};

struct wallet_options final {
  gateway::schema::domain_t domain{};
  gateway::schema::address_t contract{};
  gateway::transfer::typed_data::domain eip712{
      gateway::transfer::typed_data::wallet_domain()};
  /// Seeded into state when the wallet starts.
  std::vector<gateway::schema::address_t> tokens;
  std::vector<gateway::schema::address_t> burn_signers;
  std::optional<gateway::schema::address_t> fee_recipient;
  std::optional<gateway::schema::block_height_t> withdrawal_delay;
};

/// Source-side custody contract: holds deposits, runs the withdrawal delay,
/// and executes signed burn intents against the balance ledger.
///
/// Every state-changing call is one transaction: on success its writes are
/// committed atomically and its events returned, on failure the result
/// carries the error code and nothing is written.
class wallet final {
 public:
  wallet(gateway::schema::encoding::scale_encoder_t& encoder,
         gateway::storage::rocksdb_storage_t& storage,
         wallet_options options,
         token_operations tokens);

  /// Deposit value of token for ctx.sender.
  gateway::schema::transaction_result_t deposit(
      const call_context& ctx,
      const gateway::schema::address_t& token,
      const gateway::schema::amount_t& value);

  /// Deposit value of token pulled from ctx.sender, credited to depositor.
  gateway::schema::transaction_result_t deposit_for(
      const call_context& ctx,
      const gateway::schema::address_t& token,
      const gateway::schema::address_t& depositor,
      const gateway::schema::amount_t& value);

  /// Start the withdrawal delay for value of ctx.sender's available balance.
  gateway::schema::transaction_result_t initiate_withdrawal(
      const call_context& ctx,
      const gateway::schema::address_t& token,
      const gateway::schema::amount_t& value);

  /// Pay out ctx.sender's withdrawing balance once the delay has passed.
  gateway::schema::transaction_result_t withdraw(
      const call_context& ctx,
      const gateway::schema::address_t& token);

  gateway::schema::transaction_result_t add_delegate(
      const call_context& ctx,
      const gateway::schema::address_t& token,
      const gateway::schema::address_t& delegate);
  gateway::schema::transaction_result_t remove_delegate(
      const call_context& ctx,
      const gateway::schema::address_t& token,
      const gateway::schema::address_t& delegate);

  /// Execute a SCALE-encoded burn batch signed by a burn signer.
  ///
  /// Intents for other domains are skipped. Each relevant intent debits
  /// value + fee from the depositor, fee last, and is marked used even when
  /// the balance falls short. Collected fees go to the fee recipient and the
  /// rest is burned.
  gateway::schema::transaction_result_t burn(
      const call_context& ctx,
      const gateway::schema::bytes_view_t& batch,
      const gateway::schema::signature_t& burn_signature);

  gateway::schema::transaction_result_t add_supported_token(
      const gateway::schema::address_t& token);
  gateway::schema::transaction_result_t add_burn_signer(
      const gateway::schema::address_t& signer);
  gateway::schema::transaction_result_t remove_burn_signer(
      const gateway::schema::address_t& signer);
  gateway::schema::transaction_result_t update_fee_recipient(
      const gateway::schema::address_t& recipient);
  gateway::schema::transaction_result_t update_withdrawal_delay(
      gateway::schema::block_height_t delay);

  gateway::schema::amount_t total_balance(
      const gateway::schema::address_t& token,
      const gateway::schema::address_t& depositor);
  gateway::schema::amount_t available_balance(
      const gateway::schema::address_t& token,
      const gateway::schema::address_t& depositor);
  gateway::schema::amount_t withdrawing_balance(
      const gateway::schema::address_t& token,
      const gateway::schema::address_t& depositor);
  gateway::schema::amount_t withdrawable_balance(
      const gateway::schema::address_t& token,
      const gateway::schema::address_t& depositor,
      gateway::schema::block_height_t current_block);
  gateway::schema::block_height_t withdrawal_block(
      const gateway::schema::address_t& token,
      const gateway::schema::address_t& depositor);
  bool is_token_supported(const gateway::schema::address_t& token);
  bool is_burn_signer(const gateway::schema::address_t& signer);
  bool is_authorized_for_balance(const gateway::schema::address_t& token,
                                 const gateway::schema::address_t& depositor,
                                 const gateway::schema::address_t& signer);
  std::optional<gateway::schema::address_t> fee_recipient();
  gateway::schema::block_height_t withdrawal_delay();
  bool is_transfer_spec_used(const gateway::schema::hash32_t& hash);

  const gateway::schema::hash32_t& domain_separator() const {
    return domain_separator_;
  }
  const wallet_options& options() const { return options_; }

 private:
  gateway::schema::encoding::scale_encoder_t& encoder_;
  gateway::storage::rocksdb_storage_t& storage_;
  wallet_options options_;
  token_operations tokens_;
  gateway::schema::hash32_t domain_separator_;
  std::mutex mutex_;
};

}  // namespace gateway::execution
