#pragma once

#include <cstdint>
#include <span>
#include <string_view>

#include "mpcrec/common/bytes.hpp"
#include "mpcrec/crypto/ec_point.hpp"
#include "mpcrec/crypto/scalar.hpp"

namespace mpcrec {

constexpr char kBindingMessageDomain[] = "mpcrec/bind-oauth/v1";
constexpr size_t kMaxAccountIdLen = 256;
constexpr size_t kMinBindingNonceLen = 16;
constexpr size_t kMaxBindingNonceLen = 64;

// Proof that the holder of an on-chain account key asked to bind one
// specific access token to that account.
struct BindingProof {
  Bytes signature;  // 64-byte compact ECDSA
  ECPoint signer_public_key;
  Bytes nonce;
  uint64_t timestamp = 0;  // unix seconds
};

// "mpcrec/bind-oauth/v1" || account || SHA-256(token) || nonce || timestamp,
// each length-prefixed. The token is hashed so the proof never carries it.
Bytes BuildBindingMessage(std::string_view account_id,
                          std::string_view access_token,
                          std::span<const uint8_t> nonce,
                          uint64_t timestamp);

Bytes BindingMessageDigest(std::string_view account_id,
                           std::string_view access_token,
                           std::span<const uint8_t> nonce,
                           uint64_t timestamp);

// Client-side helper used by wallets and tests.
BindingProof SignBindingMessage(const Scalar& account_secret_key,
                                std::string_view account_id,
                                std::string_view access_token,
                                Bytes nonce,
                                uint64_t timestamp);

}  // namespace mpcrec
