#include <gateway/common/critical.hpp>
#include <gateway/crypto/keccak.hpp>

namespace gateway::crypto {

namespace {

using evp_md_ptr = std::unique_ptr<EVP_MD, decltype(&EVP_MD_free)>;

// Fetched once; OpenSSL 3.2 added KECCAK-256 to the default provider.
const EVP_MD* keccak256_md() {
  static const auto md =
      evp_md_ptr{EVP_MD_fetch(nullptr, "KECCAK-256", nullptr), EVP_MD_free};
  if (!md) {
    gateway::common::critical("OpenSSL does not provide KECCAK-256");
  }
  return md.get();
}

}  // namespace

keccak256_hasher::keccak256_hasher() : ctx_{EVP_MD_CTX_new(), EVP_MD_CTX_free} {
  if (!ctx_ || EVP_DigestInit_ex2(ctx_.get(), keccak256_md(), nullptr) != 1) {
    gateway::common::critical("failed to initialise KECCAK-256 digest");
  }
}

keccak256_hasher& keccak256_hasher::update(
    const gateway::schema::bytes_view_t& bytes) {
  if (bytes.empty()) {
    return *this;
  }
  if (EVP_DigestUpdate(ctx_.get(), bytes.data(), bytes.size()) != 1) {
    gateway::common::critical("KECCAK-256 update failed");
  }
  return *this;
}

keccak256_hasher& keccak256_hasher::update(const std::string_view& str) {
  return update(gateway::schema::make_bytes_view(str));
}

keccak256_hasher& keccak256_hasher::update(
    const gateway::schema::hash32_t& word) {
  return update(gateway::schema::bytes_view_t{word.data(), word.size()});
}

gateway::schema::hash32_t keccak256_hasher::finalize() {
  auto out = gateway::schema::hash32_t{};
  auto size = 0u;
  if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &size) != 1 ||
      size != out.size()) {
    gateway::common::critical("KECCAK-256 finalize failed");
  }
  return out;
}

gateway::schema::hash32_t keccak256(
    const gateway::schema::bytes_view_t& bytes) {
  return keccak256_hasher{}.update(bytes).finalize();
}

gateway::schema::hash32_t keccak256(const std::string_view& str) {
  return keccak256_hasher{}.update(str).finalize();
}

}  // namespace gateway::crypto
