#pragma once

#include <gateway/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Every fatal cause surfaced by the codec, ledger and engines.
// Numbering is stable: it is returned as transaction_result_t::code.
namespace gateway::schema {

enum class error_code : uint32_t {
  // codec
  data_too_short = 1,
  invalid_magic = 2,
  header_too_short = 3,
  invalid_version = 4,
  overall_length_mismatch = 5,
  hook_data_too_large = 6,
  transfer_payload_overall_length_mismatch = 7,
  element_header_too_short = 8,
  element_too_short = 9,
  invalid_element_magic = 10,
  too_many_elements = 11,
  cursor_out_of_bounds = 12,
  // ledger / wallet
  no_withdrawing_balance = 20,
  insufficient_available_balance = 21,
  withdrawal_not_yet_available = 22,
  balance_overflow = 23,
  invalid_value = 24,
  unsupported_token = 25,
  invalid_signature = 26,
  // burn
  invalid_burn_signer = 30,
  malformed_burn_batch = 31,
  empty_burn_batch = 32,
  mismatched_burn = 33,
  intent_value_must_be_positive_at_index = 34,
  source_contract_mismatch_at_index = 35,
  unsupported_token_at_index = 36,
  source_signer_mismatch_at_index = 37,
  unauthorized_signer_at_index = 38,
  intent_expired_at_index = 39,
  burn_fee_too_high_at_index = 40,
  not_all_same_token = 41,
  transfer_spec_already_used_at_index = 42,
  no_relevant_burn_intents = 43,
  // mint
  invalid_attestation_signer = 50,
  attestation_value_must_be_positive_at_index = 51,
  destination_contract_mismatch_at_index = 52,
  unsupported_destination_token_at_index = 53,
  destination_caller_mismatch_at_index = 54,
  no_relevant_attestations = 55,
  // administration
  invalid_address = 60,
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code>{"DataTooShort",
                                            error_code::data_too_short},
    std::pair<std::string_view, error_code>{"InvalidMagic",
                                            error_code::invalid_magic},
    std::pair<std::string_view, error_code>{"HeaderTooShort",
                                            error_code::header_too_short},
    std::pair<std::string_view, error_code>{"InvalidVersion",
                                            error_code::invalid_version},
    std::pair<std::string_view, error_code>{
        "OverallLengthMismatch", error_code::overall_length_mismatch},
    std::pair<std::string_view, error_code>{"HookDataTooLarge",
                                            error_code::hook_data_too_large},
    std::pair<std::string_view, error_code>{
        "TransferPayloadOverallLengthMismatch",
        error_code::transfer_payload_overall_length_mismatch},
    std::pair<std::string_view, error_code>{
        "ElementHeaderTooShort", error_code::element_header_too_short},
    std::pair<std::string_view, error_code>{"ElementTooShort",
                                            error_code::element_too_short},
    std::pair<std::string_view, error_code>{"InvalidElementMagic",
                                            error_code::invalid_element_magic},
    std::pair<std::string_view, error_code>{"TooManyElements",
                                            error_code::too_many_elements},
    std::pair<std::string_view, error_code>{"CursorOutOfBounds",
                                            error_code::cursor_out_of_bounds},
    std::pair<std::string_view, error_code>{"NoWithdrawingBalance",
                                            error_code::no_withdrawing_balance},
    std::pair<std::string_view, error_code>{
        "InsufficientAvailableBalance",
        error_code::insufficient_available_balance},
    std::pair<std::string_view, error_code>{
        "WithdrawalNotYetAvailable", error_code::withdrawal_not_yet_available},
    std::pair<std::string_view, error_code>{"BalanceOverflow",
                                            error_code::balance_overflow},
    std::pair<std::string_view, error_code>{"InvalidValue",
                                            error_code::invalid_value},
    std::pair<std::string_view, error_code>{"UnsupportedToken",
                                            error_code::unsupported_token},
    std::pair<std::string_view, error_code>{"InvalidSignature",
                                            error_code::invalid_signature},
    std::pair<std::string_view, error_code>{"InvalidBurnSigner",
                                            error_code::invalid_burn_signer},
    std::pair<std::string_view, error_code>{"MalformedBurnBatch",
                                            error_code::malformed_burn_batch},
    std::pair<std::string_view, error_code>{"EmptyBurnBatch",
                                            error_code::empty_burn_batch},
    std::pair<std::string_view, error_code>{"MismatchedBurn",
                                            error_code::mismatched_burn},
    std::pair<std::string_view, error_code>{
        "IntentValueMustBePositiveAtIndex",
        error_code::intent_value_must_be_positive_at_index},
    std::pair<std::string_view, error_code>{
        "SourceContractMismatchAtIndex",
        error_code::source_contract_mismatch_at_index},
    std::pair<std::string_view, error_code>{
        "UnsupportedTokenAtIndex", error_code::unsupported_token_at_index},
    std::pair<std::string_view, error_code>{
        "SourceSignerMismatchAtIndex",
        error_code::source_signer_mismatch_at_index},
    std::pair<std::string_view, error_code>{
        "UnauthorizedSignerAtIndex", error_code::unauthorized_signer_at_index},
    std::pair<std::string_view, error_code>{
        "IntentExpiredAtIndex", error_code::intent_expired_at_index},
    std::pair<std::string_view, error_code>{
        "BurnFeeTooHighAtIndex", error_code::burn_fee_too_high_at_index},
    std::pair<std::string_view, error_code>{"NotAllSameToken",
                                            error_code::not_all_same_token},
    std::pair<std::string_view, error_code>{
        "TransferSpecAlreadyUsedAtIndex",
        error_code::transfer_spec_already_used_at_index},
    std::pair<std::string_view, error_code>{
        "NoRelevantBurnIntents", error_code::no_relevant_burn_intents},
    std::pair<std::string_view, error_code>{
        "InvalidAttestationSigner", error_code::invalid_attestation_signer},
    std::pair<std::string_view, error_code>{
        "AttestationValueMustBePositiveAtIndex",
        error_code::attestation_value_must_be_positive_at_index},
    std::pair<std::string_view, error_code>{
        "DestinationContractMismatchAtIndex",
        error_code::destination_contract_mismatch_at_index},
    std::pair<std::string_view, error_code>{
        "UnsupportedDestinationTokenAtIndex",
        error_code::unsupported_destination_token_at_index},
    std::pair<std::string_view, error_code>{
        "DestinationCallerMismatchAtIndex",
        error_code::destination_caller_mismatch_at_index},
    std::pair<std::string_view, error_code>{
        "NoRelevantAttestations", error_code::no_relevant_attestations},
    std::pair<std::string_view, error_code>{"InvalidAddress",
                                            error_code::invalid_address},
};

template <>
inline std::optional<error_code> try_from_string<error_code>(
    const std::string_view value) {
  return from_string(value, kErrorCodeMappings);
}

inline constexpr std::string_view to_string(const error_code value) {
  return to_string(value, kErrorCodeMappings).value_or("Unknown");
}

}  // namespace gateway::schema
