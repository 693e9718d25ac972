#pragma once

#include <cstdint>
#include <span>

#include "mpcrec/common/bytes.hpp"
#include "mpcrec/crypto/ec_point.hpp"
#include "mpcrec/crypto/scalar.hpp"

namespace mpcrec {

constexpr size_t kEcdsaCompactSignatureLen = 64;

// Compact (r || s) ECDSA over a 32-byte digest. High-s signatures are
// rejected so a signature has exactly one accepted encoding.
bool VerifyEcdsaCompact(const ECPoint& public_key,
                        std::span<const uint8_t> digest32,
                        std::span<const uint8_t> signature64);

// RFC 6979 deterministic nonce, low-s output.
Bytes SignEcdsaCompact(const Scalar& secret_key, std::span<const uint8_t> digest32);

}  // namespace mpcrec
