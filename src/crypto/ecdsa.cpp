#include "mpcrec/crypto/ecdsa.hpp"

#include <array>
#include <stdexcept>

#include "mpcrec/common/secure_zeroize.hpp"
#include "secp_context.hpp"

namespace mpcrec {

using internal::SecpContext;

bool VerifyEcdsaCompact(const ECPoint& public_key,
                        std::span<const uint8_t> digest32,
                        std::span<const uint8_t> signature64) {
  if (digest32.size() != 32) {
    throw std::invalid_argument("ECDSA digest must be 32 bytes");
  }
  if (signature64.size() != kEcdsaCompactSignatureLen) {
    return false;
  }

  const Bytes compressed = public_key.ToCompressedBytes();
  secp256k1_pubkey pubkey;
  if (secp256k1_ec_pubkey_parse(SecpContext(), &pubkey, compressed.data(), compressed.size()) != 1) {
    return false;
  }

  secp256k1_ecdsa_signature sig;
  if (secp256k1_ecdsa_signature_parse_compact(SecpContext(), &sig, signature64.data()) != 1) {
    return false;
  }
  // secp256k1_ecdsa_verify itself refuses non-normalized (high-s) signatures.
  return secp256k1_ecdsa_verify(SecpContext(), &sig, digest32.data(), &pubkey) == 1;
}

Bytes SignEcdsaCompact(const Scalar& secret_key, std::span<const uint8_t> digest32) {
  if (digest32.size() != 32) {
    throw std::invalid_argument("ECDSA digest must be 32 bytes");
  }

  std::array<uint8_t, 32> key_bytes = secret_key.ToCanonicalBytes();
  secp256k1_ecdsa_signature sig;
  const int signed_ok =
      secp256k1_ecdsa_sign(SecpContext(), &sig, digest32.data(), key_bytes.data(), nullptr, nullptr);
  SecureZeroizeMemory(key_bytes.data(), key_bytes.size());
  if (signed_ok != 1) {
    throw std::invalid_argument("ECDSA signing failed: secret key out of range");
  }

  Bytes out(kEcdsaCompactSignatureLen);
  if (secp256k1_ecdsa_signature_serialize_compact(SecpContext(), out.data(), &sig) != 1) {
    throw std::runtime_error("failed to serialize ECDSA signature");
  }
  return out;
}

}  // namespace mpcrec
