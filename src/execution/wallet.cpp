#include <gateway/crypto/secp256k1.hpp>
#include <gateway/execution/burn_batch.hpp>
#include <gateway/execution/detail/transaction.hpp>
#include <gateway/execution/events.hpp>
#include <gateway/execution/wallet.hpp>
#include <gateway/ledger/balances.hpp>
#include <gateway/schema/error.hpp>
#include <gateway/state/keys.hpp>
#include <gateway/state/registry.hpp>
#include <gateway/transfer/cursor.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>

namespace gateway::execution {

using gateway::schema::address_t;
using gateway::schema::amount_t;
using gateway::schema::block_height_t;
using gateway::schema::error;
using gateway::schema::error_code;
using gateway::schema::make_detail;

namespace {

void require_positive(const amount_t& value) {
  if (value == 0) {
    throw error{error_code::invalid_value,
                {make_detail("value", value.str())}};
  }
}

void require_address(const address_t& address, const std::string& field) {
  if (gateway::schema::is_zero(address)) {
    throw error{error_code::invalid_address, {make_detail("field", field)}};
  }
}

void require_supported(const gateway::state::registry& registry,
                       const address_t& token) {
  if (!registry.is_token_supported(token)) {
    throw error{error_code::unsupported_token,
                {make_detail("token", "0x" + gateway::schema::to_hex(token))}};
  }
}

gateway::state::registry wallet_registry(gateway::state::overlay& state) {
  return gateway::state::registry{state, gateway::state::key::kWalletScope};
}

/// Totals accumulated across all relevant intents of one burn call.
struct burn_totals final {
  std::optional<address_t> token;
  amount_t fees{};
  amount_t burned{};
  uint64_t relevant{};
};

}  // namespace

wallet::wallet(gateway::schema::encoding::scale_encoder_t& encoder,
               gateway::storage::rocksdb_storage_t& storage,
               wallet_options options,
               token_operations tokens)
    : encoder_{encoder},
      storage_{storage},
      options_{std::move(options)},
      tokens_{std::move(tokens)},
      domain_separator_{
          gateway::transfer::typed_data::domain_separator(options_.eip712)} {
  auto lock = std::scoped_lock{mutex_};
  auto state = gateway::state::overlay{encoder_, storage_};
  auto registry = wallet_registry(state);
  for (const auto& token : options_.tokens) {
    registry.add_supported_token(token);
  }
  for (const auto& signer : options_.burn_signers) {
    registry.add_burn_signer(signer);
  }
  if (options_.fee_recipient.has_value()) {
    registry.set_fee_recipient(*options_.fee_recipient);
  }
  if (options_.withdrawal_delay.has_value()) {
    registry.set_withdrawal_delay(*options_.withdrawal_delay);
  }
  state.commit();
  spdlog::info(
      "Gateway wallet ready on domain {} at 0x{} ({} token(s), {} burn "
      "signer(s))",
      options_.domain, gateway::schema::to_hex(options_.contract),
      options_.tokens.size(), options_.burn_signers.size());
}

gateway::schema::transaction_result_t wallet::deposit(
    const call_context& ctx,
    const address_t& token,
    const amount_t& value) {
  return deposit_for(ctx, token, ctx.sender, value);
}

gateway::schema::transaction_result_t wallet::deposit_for(
    const call_context& ctx,
    const address_t& token,
    const address_t& depositor,
    const amount_t& value) {
  return detail::run_transaction(
      mutex_, encoder_, storage_, kWalletCodespace, "deposit",
      [&](gateway::state::overlay& state, detail::events_t& events) {
        auto registry = wallet_registry(state);
        require_supported(registry, token);
        require_positive(value);
        require_address(depositor, "depositor");

        auto ledger = gateway::ledger::balances{state};
        ledger.increase_available(token, depositor, value);
        if (tokens_.pull) {
          tokens_.pull(token, ctx.sender, value);
        }
        events.push_back(make_event(
            "Deposited", {make_attribute("token", token, true),
                          make_attribute("depositor", depositor, true),
                          make_attribute("sender", ctx.sender),
                          make_attribute("value", value)}));
      });
}

gateway::schema::transaction_result_t wallet::initiate_withdrawal(
    const call_context& ctx,
    const address_t& token,
    const amount_t& value) {
  return detail::run_transaction(
      mutex_, encoder_, storage_, kWalletCodespace, "initiate_withdrawal",
      [&](gateway::state::overlay& state, detail::events_t& events) {
        require_positive(value);
        auto registry = wallet_registry(state);
        auto ledger = gateway::ledger::balances{state};
        auto delay = registry.withdrawal_delay();
        if (delay > std::numeric_limits<block_height_t>::max() -
                        ctx.block_height) {
          throw error{error_code::invalid_value,
                      {make_detail("withdrawal_delay", std::to_string(delay)),
                       make_detail("current_block",
                                   std::to_string(ctx.block_height))}};
        }
        auto withdrawable_at = ctx.block_height + delay;
        ledger.move_to_withdrawing(token, ctx.sender, value, withdrawable_at);

        auto entry = ledger.get(token, ctx.sender);
        events.push_back(make_event(
            "WithdrawalInitiated",
            {make_attribute("token", token, true),
             make_attribute("depositor", ctx.sender, true),
             make_attribute("value", value),
             make_attribute("remaining_available", entry.available),
             make_attribute("total_withdrawing", entry.withdrawing),
             make_attribute("withdrawable_at", withdrawable_at)}));
      });
}

gateway::schema::transaction_result_t wallet::withdraw(
    const call_context& ctx,
    const address_t& token) {
  return detail::run_transaction(
      mutex_, encoder_, storage_, kWalletCodespace, "withdraw",
      [&](gateway::state::overlay& state, detail::events_t& events) {
        auto ledger = gateway::ledger::balances{state};
        auto entry = ledger.get(token, ctx.sender);
        if (entry.withdrawing == 0) {
          throw error{error_code::no_withdrawing_balance};
        }
        if (ctx.block_height < entry.withdrawable_at) {
          throw error{
              error_code::withdrawal_not_yet_available,
              {make_detail("withdrawable_at",
                           std::to_string(entry.withdrawable_at)),
               make_detail("current_block", std::to_string(ctx.block_height))}};
        }
        auto value = ledger.empty_withdrawing(token, ctx.sender);
        if (tokens_.push) {
          tokens_.push(token, ctx.sender, value);
        }
        events.push_back(make_event(
            "WithdrawalCompleted",
            {make_attribute("token", token, true),
             make_attribute("depositor", ctx.sender, true),
             make_attribute("value", value)}));
      });
}

gateway::schema::transaction_result_t wallet::add_delegate(
    const call_context& ctx,
    const address_t& token,
    const address_t& delegate) {
  return detail::run_transaction(
      mutex_, encoder_, storage_, kWalletCodespace, "add_delegate",
      [&](gateway::state::overlay& state, detail::events_t& events) {
        auto registry = wallet_registry(state);
        require_supported(registry, token);
        require_address(delegate, "delegate");
        registry.add_delegate(token, ctx.sender, delegate);
        events.push_back(make_event(
            "DelegateAdded", {make_attribute("token", token, true),
                              make_attribute("depositor", ctx.sender, true),
                              make_attribute("delegate", delegate, true)}));
      });
}

gateway::schema::transaction_result_t wallet::remove_delegate(
    const call_context& ctx,
    const address_t& token,
    const address_t& delegate) {
  return detail::run_transaction(
      mutex_, encoder_, storage_, kWalletCodespace, "remove_delegate",
      [&](gateway::state::overlay& state, detail::events_t& events) {
        auto registry = wallet_registry(state);
        require_supported(registry, token);
        require_address(delegate, "delegate");
        registry.remove_delegate(token, ctx.sender, delegate);
        events.push_back(make_event(
            "DelegateRemoved", {make_attribute("token", token, true),
                                make_attribute("depositor", ctx.sender, true),
                                make_attribute("delegate", delegate, true)}));
      });
}

gateway::schema::transaction_result_t wallet::burn(
    const call_context& ctx,
    const gateway::schema::bytes_view_t& batch,
    const gateway::schema::signature_t& burn_signature) {
  return detail::run_transaction(
      mutex_, encoder_, storage_, kWalletCodespace, "burn",
      [&](gateway::state::overlay& state, detail::events_t& events) {
        auto registry = wallet_registry(state);
        auto ledger = gateway::ledger::balances{state};

        // The burn signer signs the raw batch bytes, so it is checked before
        // anything is decoded.
        auto burn_signer = gateway::crypto::recover_address(
            burn_batch_digest(batch), burn_signature);
        if (!burn_signer.has_value() ||
            !registry.is_burn_signer(*burn_signer)) {
          throw error{error_code::invalid_burn_signer};
        }

        auto decoded = try_decode_burn_batch(batch);
        if (!decoded.has_value()) {
          throw error{error_code::malformed_burn_batch};
        }
        if (decoded->empty()) {
          throw error{error_code::empty_burn_batch};
        }

        auto totals = burn_totals{};
        auto flat_index = uint64_t{};
        for (const auto& [payload_bytes, signature_bytes, fees] : *decoded) {
          auto payload = gateway::transfer::burn_intent_payload::parse(
              gateway::schema::bytes_view_t{payload_bytes});

          auto intent_signer = std::optional<address_t>{};
          if (signature_bytes.size() == std::tuple_size_v<
                                            gateway::schema::signature_t>) {
            auto signature = gateway::schema::signature_t{};
            std::copy(signature_bytes.begin(), signature_bytes.end(),
                      signature.begin());
            intent_signer = gateway::crypto::recover_address(
                gateway::transfer::typed_data::digest(
                    domain_separator_, payload.typed_data_hash()),
                signature);
          }
          if (!intent_signer.has_value()) {
            throw error{error_code::invalid_signature,
                        {make_detail("first_index",
                                     std::to_string(flat_index))}};
          }

          auto intents = payload.elements();
          if (fees.size() != intents.size()) {
            throw error{error_code::mismatched_burn,
                        {make_detail("intents", std::to_string(intents.size())),
                         make_detail("fees", std::to_string(fees.size()))}};
          }

          for (const auto& fee_word : fees) {
            auto index = flat_index++;
            auto intent = intents.next();
            auto spec = intent.spec();
            auto value = spec.value();
            auto fee = gateway::schema::make_amount(fee_word);

            if (value == 0) {
              throw error{error_code::intent_value_must_be_positive_at_index,
                          index};
            }
            if (spec.source_domain() != options_.domain) {
              spdlog::debug(
                  "Skipping burn intent {} for source domain {} (local {})",
                  index, spec.source_domain(), options_.domain);
              continue;
            }
            if (spec.source_contract() != options_.contract) {
              throw error{error_code::source_contract_mismatch_at_index, index};
            }
            auto token = spec.source_token();
            if (!registry.is_token_supported(token)) {
              throw error{error_code::unsupported_token_at_index, index};
            }
            if (spec.source_signer() != *intent_signer) {
              throw error{error_code::source_signer_mismatch_at_index, index};
            }
            auto depositor = spec.source_depositor();
            if (!registry.is_ever_authorized(token, depositor,
                                             *intent_signer)) {
              throw error{error_code::unauthorized_signer_at_index, index};
            }
            auto max_block_height = intent.max_block_height();
            if (max_block_height < ctx.block_height) {
              throw error{
                  error_code::intent_expired_at_index,
                  index,
                  {make_detail("max_block_height", max_block_height.str()),
                   make_detail("current_block",
                               std::to_string(ctx.block_height))}};
            }
            auto max_fee = intent.max_fee();
            if (fee > max_fee) {
              throw error{error_code::burn_fee_too_high_at_index,
                          index,
                          {make_detail("fee", fee.str()),
                           make_detail("max_fee", max_fee.str())}};
            }
            if (totals.token.has_value() && *totals.token != token) {
              throw error{error_code::not_all_same_token,
                          {make_detail("index", std::to_string(index))}};
            }
            totals.token = token;

            auto spec_hash = spec.hash();
            if (registry.is_used(spec_hash)) {
              throw error{error_code::transfer_spec_already_used_at_index,
                          index};
            }
            registry.mark_used(spec_hash);

            static const auto kMax = std::numeric_limits<amount_t>::max();
            if (fee > kMax - value) {
              throw error{error_code::balance_overflow,
                          {make_detail("index", std::to_string(index))}};
            }
            auto requested = amount_t{value + fee};
            auto reduction = ledger.reduce_balance(token, depositor, requested);
            auto debited = reduction.total();
            if (debited < requested) {
              spdlog::warn(
                  "Burn intent {} debited {} of requested {} from 0x{}", index,
                  debited.str(), requested.str(),
                  gateway::schema::to_hex(depositor));
              events.push_back(make_event(
                  "InsufficientBalance",
                  {make_attribute("token", token, true),
                   make_attribute("depositor", depositor, true),
                   make_attribute("value", value),
                   make_attribute("fee", fee),
                   make_attribute("debited", debited)}));
            }
            auto actual_fee =
                debited > value ? amount_t{debited - value} : amount_t{0};
            totals.fees += actual_fee;
            totals.burned += debited - actual_fee;
            ++totals.relevant;

            events.push_back(make_event(
                "GatewayBurned",
                {make_attribute("token", token, true),
                 make_attribute("depositor", depositor, true),
                 make_attribute("transfer_spec_hash", spec_hash, true),
                 make_attribute("destination_domain",
                                uint64_t{spec.destination_domain()}),
                 make_attribute("destination_recipient",
                                spec.destination_recipient()),
                 make_attribute("signer", *intent_signer),
                 make_attribute("value", value),
                 make_attribute("fee", actual_fee),
                 make_attribute("from_available", reduction.from_available),
                 make_attribute("from_withdrawing",
                                reduction.from_withdrawing)}));
          }
        }

        if (totals.relevant == 0 || !totals.token.has_value()) {
          throw error{error_code::no_relevant_burn_intents};
        }
        if (totals.fees > 0) {
          auto recipient = registry.fee_recipient();
          if (!recipient.has_value() || gateway::schema::is_zero(*recipient)) {
            throw error{error_code::invalid_address,
                        {make_detail("field", "fee_recipient")}};
          }
          if (tokens_.push) {
            tokens_.push(*totals.token, *recipient, totals.fees);
          }
        }
        if (totals.burned > 0 && tokens_.burn) {
          tokens_.burn(*totals.token, totals.burned);
        }
        spdlog::info("Burned {} intent(s): {} burned, {} in fees",
                     totals.relevant, totals.burned.str(), totals.fees.str());
      });
}

gateway::schema::transaction_result_t wallet::add_supported_token(
    const address_t& token) {
  return detail::run_transaction(
      mutex_, encoder_, storage_, kWalletCodespace, "add_supported_token",
      [&](gateway::state::overlay& state, detail::events_t& events) {
        require_address(token, "token");
        wallet_registry(state).add_supported_token(token);
        events.push_back(make_event("TokenSupported",
                                    {make_attribute("token", token, true)}));
      });
}

gateway::schema::transaction_result_t wallet::add_burn_signer(
    const address_t& signer) {
  return detail::run_transaction(
      mutex_, encoder_, storage_, kWalletCodespace, "add_burn_signer",
      [&](gateway::state::overlay& state, detail::events_t& events) {
        require_address(signer, "signer");
        wallet_registry(state).add_burn_signer(signer);
        events.push_back(make_event("BurnSignerAdded",
                                    {make_attribute("signer", signer, true)}));
      });
}

gateway::schema::transaction_result_t wallet::remove_burn_signer(
    const address_t& signer) {
  return detail::run_transaction(
      mutex_, encoder_, storage_, kWalletCodespace, "remove_burn_signer",
      [&](gateway::state::overlay& state, detail::events_t& events) {
        wallet_registry(state).remove_burn_signer(signer);
        events.push_back(make_event("BurnSignerRemoved",
                                    {make_attribute("signer", signer, true)}));
      });
}

gateway::schema::transaction_result_t wallet::update_fee_recipient(
    const address_t& recipient) {
  return detail::run_transaction(
      mutex_, encoder_, storage_, kWalletCodespace, "update_fee_recipient",
      [&](gateway::state::overlay& state, detail::events_t& events) {
        require_address(recipient, "fee_recipient");
        auto registry = wallet_registry(state);
        auto previous = registry.fee_recipient().value_or(address_t{});
        registry.set_fee_recipient(recipient);
        events.push_back(make_event(
            "FeeRecipientChanged", {make_attribute("previous", previous),
                                    make_attribute("recipient", recipient)}));
      });
}

gateway::schema::transaction_result_t wallet::update_withdrawal_delay(
    const gateway::schema::block_height_t delay) {
  return detail::run_transaction(
      mutex_, encoder_, storage_, kWalletCodespace, "update_withdrawal_delay",
      [&](gateway::state::overlay& state, detail::events_t& events) {
        auto registry = wallet_registry(state);
        auto previous = registry.withdrawal_delay();
        registry.set_withdrawal_delay(delay);
        events.push_back(make_event("WithdrawalDelayChanged",
                                    {make_attribute("previous", previous),
                                     make_attribute("delay", delay)}));
      });
}

amount_t wallet::total_balance(const address_t& token,
                               const address_t& depositor) {
  return detail::run_query(mutex_, encoder_, storage_,
                           [&](gateway::state::overlay& state) {
                             return gateway::ledger::balances{state}.total(
                                 token, depositor);
                           });
}

amount_t wallet::available_balance(const address_t& token,
                                   const address_t& depositor) {
  return detail::run_query(mutex_, encoder_, storage_,
                           [&](gateway::state::overlay& state) {
                             return gateway::ledger::balances{state}.available(
                                 token, depositor);
                           });
}

amount_t wallet::withdrawing_balance(const address_t& token,
                                     const address_t& depositor) {
  return detail::run_query(
      mutex_, encoder_, storage_, [&](gateway::state::overlay& state) {
        return gateway::ledger::balances{state}.withdrawing(token, depositor);
      });
}

amount_t wallet::withdrawable_balance(
    const address_t& token,
    const address_t& depositor,
    const gateway::schema::block_height_t current_block) {
  return detail::run_query(
      mutex_, encoder_, storage_, [&](gateway::state::overlay& state) {
        return gateway::ledger::balances{state}.withdrawable(token, depositor,
                                                             current_block);
      });
}

gateway::schema::block_height_t wallet::withdrawal_block(
    const address_t& token,
    const address_t& depositor) {
  return detail::run_query(
      mutex_, encoder_, storage_, [&](gateway::state::overlay& state) {
        return gateway::ledger::balances{state}.withdrawal_block(token,
                                                                 depositor);
      });
}

bool wallet::is_token_supported(const address_t& token) {
  return detail::run_query(
      mutex_, encoder_, storage_, [&](gateway::state::overlay& state) {
        return wallet_registry(state).is_token_supported(token);
      });
}

bool wallet::is_burn_signer(const address_t& signer) {
  return detail::run_query(
      mutex_, encoder_, storage_, [&](gateway::state::overlay& state) {
        return wallet_registry(state).is_burn_signer(signer);
      });
}

bool wallet::is_authorized_for_balance(const address_t& token,
                                       const address_t& depositor,
                                       const address_t& signer) {
  return detail::run_query(
      mutex_, encoder_, storage_, [&](gateway::state::overlay& state) {
        return signer == depositor ||
               wallet_registry(state).delegate(token, depositor, signer) ==
                   gateway::state::delegate_status::authorized;
      });
}

std::optional<address_t> wallet::fee_recipient() {
  return detail::run_query(mutex_, encoder_, storage_,
                           [&](gateway::state::overlay& state) {
                             return wallet_registry(state).fee_recipient();
                           });
}

gateway::schema::block_height_t wallet::withdrawal_delay() {
  return detail::run_query(mutex_, encoder_, storage_,
                           [&](gateway::state::overlay& state) {
                             return wallet_registry(state).withdrawal_delay();
                           });
}

bool wallet::is_transfer_spec_used(const gateway::schema::hash32_t& hash) {
  return detail::run_query(mutex_, encoder_, storage_,
                           [&](gateway::state::overlay& state) {
                             return wallet_registry(state).is_used(hash);
                           });
}

}  // namespace gateway::execution
