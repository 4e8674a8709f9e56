#pragma once

#include <gateway/schema/primitives.hpp>
#include <gateway/state/overlay.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace gateway::state {

enum class delegate_status : uint8_t { none = 0, authorized = 1, revoked = 2 };

/// Collaborator state owned by one contract (the wallet or the minter):
/// supported tokens, signer roles, fee recipient, withdrawal delay, used
/// TransferSpec hashes. Delegation is shared and keyed by (token, depositor).
class registry final {
 public:
  registry(overlay& state, std::string_view scope);

  bool is_token_supported(const gateway::schema::address_t& token) const;
  void add_supported_token(const gateway::schema::address_t& token);

  bool is_burn_signer(const gateway::schema::address_t& signer) const;
  void add_burn_signer(const gateway::schema::address_t& signer);
  void remove_burn_signer(const gateway::schema::address_t& signer);

  bool is_attestation_signer(const gateway::schema::address_t& signer) const;
  void add_attestation_signer(const gateway::schema::address_t& signer);
  void remove_attestation_signer(const gateway::schema::address_t& signer);

  std::optional<gateway::schema::address_t> fee_recipient() const;
  void set_fee_recipient(const gateway::schema::address_t& recipient);

  gateway::schema::block_height_t withdrawal_delay() const;
  void set_withdrawal_delay(gateway::schema::block_height_t delay);

  bool is_used(const gateway::schema::hash32_t& transfer_spec_hash) const;
  void mark_used(const gateway::schema::hash32_t& transfer_spec_hash);

  delegate_status delegate(const gateway::schema::address_t& token,
                           const gateway::schema::address_t& depositor,
                           const gateway::schema::address_t& delegate) const;
  void add_delegate(const gateway::schema::address_t& token,
                    const gateway::schema::address_t& depositor,
                    const gateway::schema::address_t& delegate);
  /// Revokes a current delegate. The delegate stays ever-authorized.
  void remove_delegate(const gateway::schema::address_t& token,
                       const gateway::schema::address_t& depositor,
                       const gateway::schema::address_t& delegate);

  /// The depositor itself, or anyone it ever delegated to for this token.
  bool is_ever_authorized(const gateway::schema::address_t& token,
                          const gateway::schema::address_t& depositor,
                          const gateway::schema::address_t& signer) const;

 private:
  bool flag(const gateway::schema::bytes_t& state_key) const;
  void set_flag(const gateway::schema::bytes_t& state_key, bool value);

  overlay& state_;
  std::string_view scope_;
};

}  // namespace gateway::state
