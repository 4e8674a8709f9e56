#include <gateway/crypto/keccak.hpp>
#include <gateway/crypto/secp256k1.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/param_build.h>

#include <algorithm>
#include <array>
#include <memory>
#include <vector>

namespace gateway::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using bn_ctx_ptr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
using ec_group_ptr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;
using ec_point_ptr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;
using param_bld_ptr =
    std::unique_ptr<OSSL_PARAM_BLD, decltype(&OSSL_PARAM_BLD_free)>;
using param_ptr = std::unique_ptr<OSSL_PARAM, decltype(&OSSL_PARAM_free)>;

constexpr auto kUncompressedPointSize = std::size_t{65};

struct curve final {
  ec_group_ptr group{nullptr, EC_GROUP_free};
  bn_ctx_ptr ctx{nullptr, BN_CTX_free};
  bignum_ptr order{nullptr, BN_free};
  bignum_ptr half_order{nullptr, BN_free};
};

std::optional<curve> make_curve() {
  auto out = curve{};
  out.group.reset(EC_GROUP_new_by_curve_name(NID_secp256k1));
  out.ctx.reset(BN_CTX_new());
  out.order.reset(BN_new());
  out.half_order.reset(BN_new());
  if (!out.group || !out.ctx || !out.order || !out.half_order) {
    return std::nullopt;
  }
  if (EC_GROUP_get_order(out.group.get(), out.order.get(), out.ctx.get()) !=
          1 ||
      BN_rshift1(out.half_order.get(), out.order.get()) != 1) {
    return std::nullopt;
  }
  return out;
}

bignum_ptr make_bignum(const uint8_t* data, const std::size_t size) {
  return bignum_ptr{BN_bin2bn(data, static_cast<int>(size), nullptr), BN_free};
}

std::optional<std::array<uint8_t, kUncompressedPointSize>> encode_point(
    const curve& secp,
    const EC_POINT* point) {
  auto out = std::array<uint8_t, kUncompressedPointSize>{};
  auto written = EC_POINT_point2oct(secp.group.get(), point,
                                    POINT_CONVERSION_UNCOMPRESSED, out.data(),
                                    out.size(), secp.ctx.get());
  if (written != out.size()) {
    return std::nullopt;
  }
  return out;
}

gateway::schema::address_t address_from_point(
    const std::array<uint8_t, kUncompressedPointSize>& encoded) {
  // The 0x04 prefix is not part of the hashed public key.
  auto digest =
      keccak256(gateway::schema::bytes_view_t{encoded.data() + 1, 64});
  auto address = gateway::schema::address_t{};
  std::copy(std::begin(digest) + 12, std::end(digest),
            std::begin(address) + 12);
  return address;
}

std::optional<std::array<uint8_t, kUncompressedPointSize>> public_key_of(
    const curve& secp,
    const BIGNUM* secret) {
  if (BN_is_zero(secret) || BN_cmp(secret, secp.order.get()) >= 0) {
    return std::nullopt;
  }
  auto point = ec_point_ptr{EC_POINT_new(secp.group.get()), EC_POINT_free};
  if (!point || EC_POINT_mul(secp.group.get(), point.get(), secret, nullptr,
                             nullptr, secp.ctx.get()) != 1) {
    return std::nullopt;
  }
  return encode_point(secp, point.get());
}

evp_pkey_ptr make_signing_key(
    const BIGNUM* secret,
    const std::array<uint8_t, kUncompressedPointSize>& public_key) {
  auto none = evp_pkey_ptr{nullptr, EVP_PKEY_free};
  auto builder = param_bld_ptr{OSSL_PARAM_BLD_new(), OSSL_PARAM_BLD_free};
  if (!builder) {
    return none;
  }
  if (OSSL_PARAM_BLD_push_utf8_string(
          builder.get(), OSSL_PKEY_PARAM_GROUP_NAME, "secp256k1", 0) != 1 ||
      OSSL_PARAM_BLD_push_BN(builder.get(), OSSL_PKEY_PARAM_PRIV_KEY,
                             secret) != 1 ||
      OSSL_PARAM_BLD_push_octet_string(builder.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                       public_key.data(),
                                       public_key.size()) != 1) {
    return none;
  }
  auto params =
      param_ptr{OSSL_PARAM_BLD_to_param(builder.get()), OSSL_PARAM_free};
  if (!params) {
    return none;
  }

  auto key_ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!key_ctx || EVP_PKEY_fromdata_init(key_ctx.get()) != 1) {
    return none;
  }
  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(key_ctx.get(), &raw_pkey, EVP_PKEY_KEYPAIR,
                        params.get()) != 1) {
    return none;
  }
  return evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
}

}  // namespace

bool available() {
  static const auto available_now = make_curve().has_value();
  return available_now;
}

std::optional<gateway::schema::address_t> recover_address(
    const gateway::schema::hash32_t& digest,
    const gateway::schema::signature_t& signature) {
  auto v = signature[64];
  if (v >= 27) {
    v = static_cast<uint8_t>(v - 27);
  }
  if (v > 1) {
    return std::nullopt;
  }

  auto secp = make_curve();
  if (!secp) {
    return std::nullopt;
  }

  auto r = make_bignum(signature.data(), 32);
  auto s = make_bignum(signature.data() + 32, 32);
  if (!r || !s) {
    return std::nullopt;
  }
  if (BN_is_zero(r.get()) || BN_is_zero(s.get()) ||
      BN_cmp(r.get(), secp->order.get()) >= 0 ||
      BN_cmp(s.get(), secp->order.get()) >= 0 ||
      BN_cmp(s.get(), secp->half_order.get()) > 0) {
    return std::nullopt;
  }

  auto nonce_point =
      ec_point_ptr{EC_POINT_new(secp->group.get()), EC_POINT_free};
  if (!nonce_point ||
      EC_POINT_set_compressed_coordinates(secp->group.get(), nonce_point.get(),
                                          r.get(), v, secp->ctx.get()) != 1) {
    return std::nullopt;
  }

  // Q = r^-1 * (s * R - e * G)
  auto e = make_bignum(digest.data(), digest.size());
  auto r_inverse = bignum_ptr{
      BN_mod_inverse(nullptr, r.get(), secp->order.get(), secp->ctx.get()),
      BN_free};
  auto zero = bignum_ptr{BN_new(), BN_free};
  auto scaled = bignum_ptr{BN_new(), BN_free};
  auto u1 = bignum_ptr{BN_new(), BN_free};
  auto u2 = bignum_ptr{BN_new(), BN_free};
  if (!e || !r_inverse || !zero || !scaled || !u1 || !u2) {
    return std::nullopt;
  }
  BN_zero(zero.get());
  if (BN_mod_mul(scaled.get(), e.get(), r_inverse.get(), secp->order.get(),
                 secp->ctx.get()) != 1 ||
      BN_mod_sub(u1.get(), zero.get(), scaled.get(), secp->order.get(),
                 secp->ctx.get()) != 1 ||
      BN_mod_mul(u2.get(), s.get(), r_inverse.get(), secp->order.get(),
                 secp->ctx.get()) != 1) {
    return std::nullopt;
  }

  auto public_point =
      ec_point_ptr{EC_POINT_new(secp->group.get()), EC_POINT_free};
  if (!public_point ||
      EC_POINT_mul(secp->group.get(), public_point.get(), u1.get(),
                   nonce_point.get(), u2.get(), secp->ctx.get()) != 1 ||
      EC_POINT_is_at_infinity(secp->group.get(), public_point.get()) == 1) {
    return std::nullopt;
  }

  auto encoded = encode_point(*secp, public_point.get());
  if (!encoded) {
    return std::nullopt;
  }
  return address_from_point(*encoded);
}

std::optional<gateway::schema::address_t> address_from_private_key(
    const gateway::schema::private_key_t& private_key) {
  auto secp = make_curve();
  auto secret = make_bignum(private_key.data(), private_key.size());
  if (!secp || !secret) {
    return std::nullopt;
  }
  auto public_key = public_key_of(*secp, secret.get());
  if (!public_key) {
    return std::nullopt;
  }
  return address_from_point(*public_key);
}

std::optional<gateway::schema::signature_t> sign_digest(
    const gateway::schema::hash32_t& digest,
    const gateway::schema::private_key_t& private_key) {
  auto secp = make_curve();
  auto secret = make_bignum(private_key.data(), private_key.size());
  if (!secp || !secret) {
    return std::nullopt;
  }
  auto public_key = public_key_of(*secp, secret.get());
  if (!public_key) {
    return std::nullopt;
  }
  auto pkey = make_signing_key(secret.get(), *public_key);
  if (!pkey) {
    return std::nullopt;
  }

  auto sign_ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new(pkey.get(), nullptr),
                                   EVP_PKEY_CTX_free};
  if (!sign_ctx || EVP_PKEY_sign_init(sign_ctx.get()) != 1) {
    return std::nullopt;
  }
  auto der_size = std::size_t{};
  if (EVP_PKEY_sign(sign_ctx.get(), nullptr, &der_size, digest.data(),
                    digest.size()) != 1) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(der_size);
  if (EVP_PKEY_sign(sign_ctx.get(), der.data(), &der_size, digest.data(),
                    digest.size()) != 1) {
    return std::nullopt;
  }

  const auto* der_ptr = static_cast<const uint8_t*>(der.data());
  auto ecdsa_sig = ecdsa_sig_ptr{
      d2i_ECDSA_SIG(nullptr, &der_ptr, static_cast<long>(der_size)),
      ECDSA_SIG_free};
  if (!ecdsa_sig) {
    return std::nullopt;
  }
  const auto* r = ECDSA_SIG_get0_r(ecdsa_sig.get());
  const auto* s = ECDSA_SIG_get0_s(ecdsa_sig.get());

  auto low_s = bignum_ptr{BN_dup(s), BN_free};
  if (!low_s) {
    return std::nullopt;
  }
  if (BN_cmp(low_s.get(), secp->half_order.get()) > 0 &&
      BN_sub(low_s.get(), secp->order.get(), s) != 1) {
    return std::nullopt;
  }

  auto signature = gateway::schema::signature_t{};
  if (BN_bn2binpad(r, signature.data(), 32) != 32 ||
      BN_bn2binpad(low_s.get(), signature.data() + 32, 32) != 32) {
    return std::nullopt;
  }

  auto expected = address_from_point(*public_key);
  for (uint8_t v = 27; v <= 28; ++v) {
    signature[64] = v;
    auto recovered = recover_address(digest, signature);
    if (recovered.has_value() && *recovered == expected) {
      return signature;
    }
  }
  return std::nullopt;
}

gateway::schema::hash32_t eth_signed_message_hash(
    const gateway::schema::hash32_t& message_hash) {
  return keccak256_hasher{}
      .update(std::string_view{"\x19"
                               "Ethereum Signed Message:\n32"})
      .update(message_hash)
      .finalize();
}

}  // namespace gateway::crypto
