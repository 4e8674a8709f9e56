#pragma once

#include <gateway/schema/primitives.hpp>

#include <string_view>

// Key prefixes and key codecs for the persisted gateway state. One RocksDB
// keyspace, one prefix per concern; contract-owned sets carry a scope.
namespace gateway::state::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kBalanceKeyPrefix{"SYS|STATE|BALANCE|"};
inline constexpr std::string_view kDelegateKeyPrefix{"SYS|STATE|DELEGATE|"};

inline constexpr std::string_view kWalletScope{"WALLET"};
inline constexpr std::string_view kMinterScope{"MINTER"};

inline constexpr std::string_view kUsedHashPart{"|USED|"};
inline constexpr std::string_view kTokenPart{"|TOKEN|"};
inline constexpr std::string_view kBurnSignerPart{"|BURN_SIGNER|"};
inline constexpr std::string_view kAttestationSignerPart{
    "|ATTESTATION_SIGNER|"};
inline constexpr std::string_view kFeeRecipientPart{"|FEE_RECIPIENT"};
inline constexpr std::string_view kWithdrawalDelayPart{"|WITHDRAWAL_DELAY"};

/// SYS|STATE|BALANCE|<token><depositor>
gateway::schema::bytes_t make_balance_key(
    const gateway::schema::address_t& token,
    const gateway::schema::address_t& depositor);

/// SYS|STATE|DELEGATE|<token><depositor><delegate>
gateway::schema::bytes_t make_delegate_key(
    const gateway::schema::address_t& token,
    const gateway::schema::address_t& depositor,
    const gateway::schema::address_t& delegate);

/// SYS|STATE|<scope><part>
gateway::schema::bytes_t make_scoped_key(const std::string_view& scope,
                                         const std::string_view& part);

/// SYS|STATE|<scope><part><word>
gateway::schema::bytes_t make_scoped_key(
    const std::string_view& scope,
    const std::string_view& part,
    const gateway::schema::hash32_t& word);

}  // namespace gateway::state::key
