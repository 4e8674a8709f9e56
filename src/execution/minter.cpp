#include <gateway/crypto/secp256k1.hpp>
#include <gateway/execution/detail/transaction.hpp>
#include <gateway/execution/events.hpp>
#include <gateway/execution/minter.hpp>
#include <gateway/schema/error.hpp>
#include <gateway/state/keys.hpp>
#include <gateway/state/registry.hpp>
#include <gateway/transfer/cursor.hpp>

#include <spdlog/spdlog.h>

#include <vector>

namespace gateway::execution {

using gateway::schema::address_t;
using gateway::schema::error;
using gateway::schema::error_code;
using gateway::schema::make_detail;

namespace {

struct pending_mint final {
  address_t token{};
  address_t recipient{};
  gateway::schema::amount_t value{};
};

gateway::state::registry minter_registry(gateway::state::overlay& state) {
  return gateway::state::registry{state, gateway::state::key::kMinterScope};
}

}  // namespace

minter::minter(gateway::schema::encoding::scale_encoder_t& encoder,
               gateway::storage::rocksdb_storage_t& storage,
               minter_options options,
               token_operations tokens)
    : encoder_{encoder},
      storage_{storage},
      options_{std::move(options)},
      tokens_{std::move(tokens)},
      domain_separator_{
          gateway::transfer::typed_data::domain_separator(options_.eip712)} {
  auto lock = std::scoped_lock{mutex_};
  auto state = gateway::state::overlay{encoder_, storage_};
  auto registry = minter_registry(state);
  for (const auto& token : options_.tokens) {
    registry.add_supported_token(token);
  }
  for (const auto& signer : options_.attestation_signers) {
    registry.add_attestation_signer(signer);
  }
  state.commit();
  spdlog::info("Gateway minter ready on domain {} at 0x{}", options_.domain,
               gateway::schema::to_hex(options_.contract));
}

gateway::schema::transaction_result_t minter::mint(
    const call_context& ctx,
    const gateway::schema::bytes_view_t& attestations,
    const gateway::schema::signature_t& signature) {
  return detail::run_transaction(
      mutex_, encoder_, storage_, kMinterCodespace, "mint",
      [&](gateway::state::overlay& state, detail::events_t& events) {
        auto payload =
            gateway::transfer::attestation_payload::parse(attestations);
        auto registry = minter_registry(state);

        auto signer = gateway::crypto::recover_address(
            gateway::transfer::typed_data::digest(domain_separator_,
                                                  payload.typed_data_hash()),
            signature);
        if (!signer.has_value() || !registry.is_attestation_signer(*signer)) {
          throw error{error_code::invalid_attestation_signer};
        }

        // Token mints run only once every attestation has been accepted.
        auto pending = std::vector<pending_mint>{};
        auto it = payload.elements();
        while (!it.done()) {
          auto index = uint64_t{it.index()};
          auto spec = it.next().spec();
          auto value = spec.value();
          if (value == 0) {
            throw error{error_code::attestation_value_must_be_positive_at_index,
                        index};
          }
          if (spec.destination_domain() != options_.domain) {
            spdlog::debug(
                "Skipping attestation {} for destination domain {} (local {})",
                index, spec.destination_domain(), options_.domain);
            continue;
          }
          if (spec.destination_contract() != options_.contract) {
            throw error{error_code::destination_contract_mismatch_at_index,
                        index};
          }
          auto token = spec.destination_token();
          if (!registry.is_token_supported(token)) {
            throw error{error_code::unsupported_destination_token_at_index,
                        index};
          }
          auto caller = spec.destination_caller();
          if (!gateway::schema::is_zero(caller) && caller != ctx.sender) {
            throw error{error_code::destination_caller_mismatch_at_index,
                        index,
                        {make_detail("sender", "0x" + gateway::schema::to_hex(
                                                          ctx.sender))}};
          }
          auto spec_hash = spec.hash();
          if (registry.is_used(spec_hash)) {
            throw error{error_code::transfer_spec_already_used_at_index,
                        index};
          }
          registry.mark_used(spec_hash);

          auto recipient = spec.destination_recipient();
          pending.push_back(pending_mint{token, recipient, value});
          events.push_back(make_event(
              "GatewayMinted",
              {make_attribute("token", token, true),
               make_attribute("recipient", recipient, true),
               make_attribute("transfer_spec_hash", spec_hash, true),
               make_attribute("source_domain", uint64_t{spec.source_domain()}),
               make_attribute("source_depositor", spec.source_depositor()),
               make_attribute("value", value)}));
        }
        if (pending.empty()) {
          throw error{error_code::no_relevant_attestations};
        }
        if (tokens_.mint) {
          for (const auto& entry : pending) {
            tokens_.mint(entry.token, entry.recipient, entry.value);
          }
        }
      });
}

gateway::schema::transaction_result_t minter::add_supported_token(
    const address_t& token) {
  return detail::run_transaction(
      mutex_, encoder_, storage_, kMinterCodespace, "add_supported_token",
      [&](gateway::state::overlay& state, detail::events_t& events) {
        if (gateway::schema::is_zero(token)) {
          throw error{error_code::invalid_address,
                      {make_detail("field", "token")}};
        }
        minter_registry(state).add_supported_token(token);
        events.push_back(make_event("TokenSupported",
                                    {make_attribute("token", token, true)}));
      });
}

gateway::schema::transaction_result_t minter::add_attestation_signer(
    const address_t& signer) {
  return detail::run_transaction(
      mutex_, encoder_, storage_, kMinterCodespace, "add_attestation_signer",
      [&](gateway::state::overlay& state, detail::events_t& events) {
        if (gateway::schema::is_zero(signer)) {
          throw error{error_code::invalid_address,
                      {make_detail("field", "signer")}};
        }
        minter_registry(state).add_attestation_signer(signer);
        events.push_back(make_event("AttestationSignerAdded",
                                    {make_attribute("signer", signer, true)}));
      });
}

gateway::schema::transaction_result_t minter::remove_attestation_signer(
    const address_t& signer) {
  return detail::run_transaction(
      mutex_, encoder_, storage_, kMinterCodespace, "remove_attestation_signer",
      [&](gateway::state::overlay& state, detail::events_t& events) {
        minter_registry(state).remove_attestation_signer(signer);
        events.push_back(make_event("AttestationSignerRemoved",
                                    {make_attribute("signer", signer, true)}));
      });
}

bool minter::is_token_supported(const address_t& token) {
  return detail::run_query(
      mutex_, encoder_, storage_, [&](gateway::state::overlay& state) {
        return minter_registry(state).is_token_supported(token);
      });
}

bool minter::is_attestation_signer(const address_t& signer) {
  return detail::run_query(
      mutex_, encoder_, storage_, [&](gateway::state::overlay& state) {
        return minter_registry(state).is_attestation_signer(signer);
      });
}

bool minter::is_transfer_spec_used(const gateway::schema::hash32_t& hash) {
  return detail::run_query(mutex_, encoder_, storage_,
                           [&](gateway::state::overlay& state) {
                             return minter_registry(state).is_used(hash);
                           });
}

}  // namespace gateway::execution
