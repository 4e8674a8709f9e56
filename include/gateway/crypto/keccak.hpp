#pragma once
#include <gateway/schema/primitives.hpp>
#include <memory>
#include <string_view>

#include <openssl/evp.h>

namespace gateway::crypto {

/// Incremental Keccak-256 (the original Keccak padding used by Ethereum,
/// not FIPS-202 SHA3-256), backed by OpenSSL's KECCAK-256 digest.
class keccak256_hasher final {
 public:
  keccak256_hasher();

  keccak256_hasher& update(const gateway::schema::bytes_view_t& bytes);
  keccak256_hasher& update(const std::string_view& str);
  keccak256_hasher& update(const gateway::schema::hash32_t& word);

  /// Returns the digest. The hasher must not be reused.
  gateway::schema::hash32_t finalize();

 private:
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx_;
};

gateway::schema::hash32_t keccak256(const gateway::schema::bytes_view_t& bytes);
gateway::schema::hash32_t keccak256(const std::string_view& str);

}  // namespace gateway::crypto
