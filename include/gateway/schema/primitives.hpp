#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gateway::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using word_t = hash32_t;
// 32-byte left-padded address, as carried on the wire.
using address_t = hash32_t;
using evm_address_t = std::array<uint8_t, 20>;
using private_key_t = hash32_t;
// [r || s || v], v in {0, 1, 27, 28}
using signature_t = std::array<uint8_t, 65>;
using amount_t = boost::multiprecision::uint256_t;
using domain_t = uint32_t;
using block_height_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);


hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);
std::optional<bytes_t> try_from_hex(const std::string_view hex);
bytes_t from_hex(const std::string_view hex);

/// Left-pad a 20-byte EVM address into a 32-byte word.
address_t make_address(const evm_address_t& address);
/// Parse a 20-byte (40 hex) or 32-byte (64 hex) address, 0x prefix optional.
std::optional<address_t> try_make_address(const std::string_view hex);
bool is_zero(const hash32_t& value);

/// Big-endian 32-byte word <-> uint256.
amount_t make_amount(const word_t& word);
amount_t make_amount(const bytes_view_t& word);
word_t make_word(const amount_t& value);
word_t make_word(uint64_t value);
std::optional<amount_t> try_make_amount(const std::string_view decimal);

std::optional<signature_t> try_make_signature(const std::string_view hex);

}  // namespace gateway::schema
