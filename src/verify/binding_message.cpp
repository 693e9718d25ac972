#include "mpcrec/verify/binding_message.hpp"

#include <stdexcept>
#include <utility>

#include "mpcrec/crypto/ecdsa.hpp"
#include "mpcrec/crypto/encoding.hpp"
#include "mpcrec/crypto/hash.hpp"

namespace mpcrec {

Bytes BuildBindingMessage(std::string_view account_id,
                          std::string_view access_token,
                          std::span<const uint8_t> nonce,
                          uint64_t timestamp) {
  if (account_id.empty()) {
    throw std::invalid_argument("binding message requires an account id");
  }
  if (nonce.size() < kMinBindingNonceLen || nonce.size() > kMaxBindingNonceLen) {
    throw std::invalid_argument("binding nonce must be 16..64 bytes");
  }

  ByteWriter writer;
  writer.WriteString(kBindingMessageDomain);
  writer.WriteString(account_id);
  writer.WriteSized(Sha256(AsByteSpan(access_token)));
  writer.WriteSized(nonce);
  writer.WriteU64(timestamp);
  return writer.Take();
}

Bytes BindingMessageDigest(std::string_view account_id,
                           std::string_view access_token,
                           std::span<const uint8_t> nonce,
                           uint64_t timestamp) {
  return Sha256(BuildBindingMessage(account_id, access_token, nonce, timestamp));
}

BindingProof SignBindingMessage(const Scalar& account_secret_key,
                                std::string_view account_id,
                                std::string_view access_token,
                                Bytes nonce,
                                uint64_t timestamp) {
  const Bytes digest = BindingMessageDigest(account_id, access_token, nonce, timestamp);

  BindingProof proof;
  proof.signature = SignEcdsaCompact(account_secret_key, digest);
  proof.signer_public_key = ECPoint::GeneratorMultiply(account_secret_key);
  proof.nonce = std::move(nonce);
  proof.timestamp = timestamp;
  return proof;
}

}  // namespace mpcrec
