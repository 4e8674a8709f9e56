#include <gateway/state/keys.hpp>
#include <gateway/state/registry.hpp>

namespace gateway::state {

registry::registry(overlay& state, const std::string_view scope)
    : state_{state}, scope_{scope} {}

bool registry::flag(const gateway::schema::bytes_t& state_key) const {
  return state_.get<bool>(gateway::schema::bytes_view_t{state_key})
      .value_or(false);
}

void registry::set_flag(const gateway::schema::bytes_t& state_key,
                        const bool value) {
  if (value) {
    state_.put(gateway::schema::bytes_view_t{state_key}, true);
  } else {
    state_.erase(gateway::schema::bytes_view_t{state_key});
  }
}

bool registry::is_token_supported(
    const gateway::schema::address_t& token) const {
  return flag(key::make_scoped_key(scope_, key::kTokenPart, token));
}

void registry::add_supported_token(const gateway::schema::address_t& token) {
  set_flag(key::make_scoped_key(scope_, key::kTokenPart, token), true);
}

bool registry::is_burn_signer(const gateway::schema::address_t& signer) const {
  return flag(key::make_scoped_key(scope_, key::kBurnSignerPart, signer));
}

void registry::add_burn_signer(const gateway::schema::address_t& signer) {
  set_flag(key::make_scoped_key(scope_, key::kBurnSignerPart, signer), true);
}

void registry::remove_burn_signer(const gateway::schema::address_t& signer) {
  set_flag(key::make_scoped_key(scope_, key::kBurnSignerPart, signer), false);
}

bool registry::is_attestation_signer(
    const gateway::schema::address_t& signer) const {
  return flag(
      key::make_scoped_key(scope_, key::kAttestationSignerPart, signer));
}

void registry::add_attestation_signer(
    const gateway::schema::address_t& signer) {
  set_flag(key::make_scoped_key(scope_, key::kAttestationSignerPart, signer),
           true);
}

void registry::remove_attestation_signer(
    const gateway::schema::address_t& signer) {
  set_flag(key::make_scoped_key(scope_, key::kAttestationSignerPart, signer),
           false);
}

std::optional<gateway::schema::address_t> registry::fee_recipient() const {
  auto state_key = key::make_scoped_key(scope_, key::kFeeRecipientPart);
  return state_.get<gateway::schema::address_t>(
      gateway::schema::bytes_view_t{state_key});
}

void registry::set_fee_recipient(const gateway::schema::address_t& recipient) {
  auto state_key = key::make_scoped_key(scope_, key::kFeeRecipientPart);
  state_.put(gateway::schema::bytes_view_t{state_key}, recipient);
}

gateway::schema::block_height_t registry::withdrawal_delay() const {
  auto state_key = key::make_scoped_key(scope_, key::kWithdrawalDelayPart);
  return state_.get<uint64_t>(gateway::schema::bytes_view_t{state_key})
      .value_or(0);
}

void registry::set_withdrawal_delay(
    const gateway::schema::block_height_t delay) {
  auto state_key = key::make_scoped_key(scope_, key::kWithdrawalDelayPart);
  state_.put(gateway::schema::bytes_view_t{state_key}, uint64_t{delay});
}

bool registry::is_used(
    const gateway::schema::hash32_t& transfer_spec_hash) const {
  return flag(
      key::make_scoped_key(scope_, key::kUsedHashPart, transfer_spec_hash));
}

void registry::mark_used(const gateway::schema::hash32_t& transfer_spec_hash) {
  set_flag(key::make_scoped_key(scope_, key::kUsedHashPart, transfer_spec_hash),
           true);
}

delegate_status registry::delegate(
    const gateway::schema::address_t& token,
    const gateway::schema::address_t& depositor,
    const gateway::schema::address_t& delegate) const {
  auto state_key = key::make_delegate_key(token, depositor, delegate);
  auto stored =
      state_.get<uint8_t>(gateway::schema::bytes_view_t{state_key});
  if (!stored.has_value()) {
    return delegate_status::none;
  }
  return static_cast<delegate_status>(*stored);
}

void registry::add_delegate(const gateway::schema::address_t& token,
                            const gateway::schema::address_t& depositor,
                            const gateway::schema::address_t& delegate) {
  auto state_key = key::make_delegate_key(token, depositor, delegate);
  state_.put(gateway::schema::bytes_view_t{state_key},
             static_cast<uint8_t>(delegate_status::authorized));
}

void registry::remove_delegate(const gateway::schema::address_t& token,
                               const gateway::schema::address_t& depositor,
                               const gateway::schema::address_t& delegate) {
  if (this->delegate(token, depositor, delegate) !=
      delegate_status::authorized) {
    return;
  }
  auto state_key = key::make_delegate_key(token, depositor, delegate);
  state_.put(gateway::schema::bytes_view_t{state_key},
             static_cast<uint8_t>(delegate_status::revoked));
}

bool registry::is_ever_authorized(
    const gateway::schema::address_t& token,
    const gateway::schema::address_t& depositor,
    const gateway::schema::address_t& signer) const {
  if (signer == depositor) {
    return true;
  }
  return delegate(token, depositor, signer) != delegate_status::none;
}

}  // namespace gateway::state
