#pragma once

#include <gateway/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace gateway::testing {

inline gateway::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = gateway::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// A 20-byte style address (upper 12 bytes zero) that no private key in
/// these tests maps to.
inline gateway::schema::address_t make_address(const uint8_t seed) {
  auto out = gateway::schema::address_t{};
  for (std::size_t i = 12; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(0xa0u + seed);
  }
  return out;
}

/// secp256k1 private key with scalar value seed.
inline gateway::schema::private_key_t make_private_key(const uint8_t seed) {
  auto out = gateway::schema::private_key_t{};
  out[31] = seed;
  return out;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace gateway::testing
