#pragma once

#include <gateway/execution/burn_batch.hpp>
#include <gateway/execution/minter.hpp>
#include <gateway/execution/token_operations.hpp>
#include <gateway/execution/wallet.hpp>
#include <gateway/schema/encoding/scale/encoder.hpp>
#include <gateway/schema/error_code.hpp>
#include <gateway/schema/transaction_result.hpp>
#include <gateway/storage/rocksdb/storage.hpp>
#include <gateway/testing/common.hpp>
#include <gateway/testing/payloads.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace gateway::testing {

/// One recorded token movement.
struct token_call final {
  std::string operation;
  gateway::schema::address_t token{};
  gateway::schema::address_t account{};
  gateway::schema::amount_t value{};
};

inline gateway::execution::token_operations make_recording_token_operations(
    std::vector<token_call>& calls) {
  return gateway::execution::token_operations{
      .pull =
          [&calls](const auto& token, const auto& from, const auto& value) {
            calls.push_back({"pull", token, from, value});
          },
      .push =
          [&calls](const auto& token, const auto& to, const auto& value) {
            calls.push_back({"push", token, to, value});
          },
      .burn =
          [&calls](const auto& token, const auto& value) {
            calls.push_back({"burn", token, {}, value});
          },
      .mint =
          [&calls](const auto& token, const auto& to, const auto& value) {
            calls.push_back({"mint", token, to, value});
          }};
}

inline gateway::execution::wallet_options make_wallet_options() {
  return gateway::execution::wallet_options{
      .domain = kSourceDomain,
      .contract = make_address(1),
      .tokens = {make_address(3)},
      .burn_signers = {address_of(9)},
      .fee_recipient = make_address(7),
      .withdrawal_delay = 10};
}

inline gateway::execution::minter_options make_minter_options() {
  return gateway::execution::minter_options{
      .domain = kDestinationDomain,
      .contract = make_address(2),
      .tokens = {make_address(4)},
      .attestation_signers = {address_of(8)}};
}

inline gateway::schema::error_code code_of(
    const gateway::schema::transaction_result_t& result) {
  return static_cast<gateway::schema::error_code>(result.code);
}

/// RocksDB-backed engine in a temporary directory, removed on destruction.
template <typename Engine, typename Options>
class engine_fixture final {
 public:
  engine_fixture(const std::string_view db_prefix, Options options)
      : db_path_{make_db_path(db_prefix)},
        encoder_{},
        storage_{gateway::storage::make_storage<
            gateway::storage::rocksdb_storage_tag>(db_path_)},
        engine_{encoder_, storage_, std::move(options),
                make_recording_token_operations(calls_)} {}

  engine_fixture(const engine_fixture&) = delete;
  engine_fixture& operator=(const engine_fixture&) = delete;
  engine_fixture(engine_fixture&&) = delete;
  engine_fixture& operator=(engine_fixture&&) = delete;

  ~engine_fixture() {
    storage_.database.reset();
    remove_path(db_path_);
  }

  Engine& engine() { return engine_; }
  gateway::storage::rocksdb_storage_t& storage() { return storage_; }
  gateway::schema::encoding::scale_encoder_t& encoder() { return encoder_; }
  std::vector<token_call>& calls() { return calls_; }

 private:
  std::string db_path_;
  std::vector<token_call> calls_;
  gateway::schema::encoding::scale_encoder_t encoder_;
  gateway::storage::rocksdb_storage_t storage_;
  Engine engine_;
};

using wallet_fixture =
    engine_fixture<gateway::execution::wallet,
                   gateway::execution::wallet_options>;
using minter_fixture =
    engine_fixture<gateway::execution::minter,
                   gateway::execution::minter_options>;

/// SCALE batch plus the burn signer's (key 9) signature over it.
struct signed_batch final {
  gateway::schema::bytes_t bytes;
  gateway::schema::signature_t signature{};
};

inline signed_batch sign_batch(const gateway::execution::burn_batch_t& batch,
                               const uint8_t burn_signer_seed = 9) {
  auto bytes = gateway::execution::encode_burn_batch(batch);
  auto digest = gateway::execution::burn_batch_digest(bytes);
  return signed_batch{.bytes = bytes,
                      .signature = sign(digest, burn_signer_seed)};
}

}  // namespace gateway::testing
