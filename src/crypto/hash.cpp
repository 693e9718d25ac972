#include "mpcrec/crypto/hash.hpp"

#include <array>
#include <stdexcept>

#include <openssl/sha.h>

namespace mpcrec {
namespace {

constexpr size_t kSha256BlockLen = 64;
constexpr size_t kHashToFieldLen = 48;

}  // namespace

Bytes Sha256(std::span<const uint8_t> data) {
  std::array<uint8_t, SHA256_DIGEST_LENGTH> digest{};
  if (SHA256(data.data(), data.size(), digest.data()) == nullptr) {
    throw std::runtime_error("SHA256 failed");
  }
  return Bytes(digest.begin(), digest.end());
}

Bytes ExpandMessageXmd(std::span<const uint8_t> message,
                       std::string_view dst,
                       size_t len_in_bytes) {
  if (dst.empty() || dst.size() > 255) {
    throw std::invalid_argument("expand_message_xmd DST must be 1..255 bytes");
  }
  const size_t ell = (len_in_bytes + SHA256_DIGEST_LENGTH - 1) / SHA256_DIGEST_LENGTH;
  if (len_in_bytes == 0 || ell > 255 || len_in_bytes > 65535) {
    throw std::invalid_argument("expand_message_xmd output length out of range");
  }

  Bytes dst_prime(dst.begin(), dst.end());
  dst_prime.push_back(static_cast<uint8_t>(dst.size()));

  Bytes msg_prime(kSha256BlockLen, 0x00);
  msg_prime.insert(msg_prime.end(), message.begin(), message.end());
  msg_prime.push_back(static_cast<uint8_t>((len_in_bytes >> 8) & 0xFF));
  msg_prime.push_back(static_cast<uint8_t>(len_in_bytes & 0xFF));
  msg_prime.push_back(0x00);
  msg_prime.insert(msg_prime.end(), dst_prime.begin(), dst_prime.end());

  const Bytes b0 = Sha256(msg_prime);

  Bytes b1_input = b0;
  b1_input.push_back(0x01);
  b1_input.insert(b1_input.end(), dst_prime.begin(), dst_prime.end());
  Bytes b_prev = Sha256(b1_input);

  Bytes uniform = b_prev;
  for (size_t i = 2; i <= ell; ++i) {
    Bytes bi_input(SHA256_DIGEST_LENGTH);
    for (size_t j = 0; j < SHA256_DIGEST_LENGTH; ++j) {
      bi_input[j] = static_cast<uint8_t>(b0[j] ^ b_prev[j]);
    }
    bi_input.push_back(static_cast<uint8_t>(i));
    bi_input.insert(bi_input.end(), dst_prime.begin(), dst_prime.end());
    b_prev = Sha256(bi_input);
    uniform.insert(uniform.end(), b_prev.begin(), b_prev.end());
  }

  uniform.resize(len_in_bytes);
  return uniform;
}

Scalar HashToScalar(std::span<const uint8_t> message, std::string_view dst) {
  const Bytes uniform = ExpandMessageXmd(message, dst, kHashToFieldLen);
  return Scalar::FromBigEndianModQ(uniform);
}

}  // namespace mpcrec
