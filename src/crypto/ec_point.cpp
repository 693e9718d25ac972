#include "mpcrec/crypto/ec_point.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <vector>

#include "mpcrec/crypto/encoding.hpp"
#include "secp_context.hpp"

namespace mpcrec {
namespace internal {

secp256k1_context* SecpContext() {
  static secp256k1_context* ctx = []() {
    secp256k1_context* created = secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
    if (created == nullptr) {
      throw std::runtime_error("Failed to create secp256k1 context");
    }
    return created;
  }();
  return ctx;
}

}  // namespace internal

namespace {

using internal::SecpContext;

secp256k1_pubkey ParsePubkey(const std::array<uint8_t, 33>& compressed) {
  secp256k1_pubkey pubkey;
  if (secp256k1_ec_pubkey_parse(SecpContext(), &pubkey, compressed.data(), compressed.size()) != 1) {
    throw std::invalid_argument("Compressed point is not a valid secp256k1 point");
  }
  return pubkey;
}

std::array<uint8_t, 33> SerializeCompressed(const secp256k1_pubkey& pubkey) {
  std::array<uint8_t, 33> out{};
  size_t out_len = out.size();
  if (secp256k1_ec_pubkey_serialize(
          SecpContext(), out.data(), &out_len, &pubkey, SECP256K1_EC_COMPRESSED) != 1 ||
      out_len != out.size()) {
    throw std::runtime_error("Failed to serialize secp256k1 point");
  }
  return out;
}

}  // namespace

ECPoint::ECPoint() {
  compressed_.fill(0);
  compressed_[0] = 0x02;
}

ECPoint ECPoint::FromCompressed(std::span<const uint8_t> compressed_bytes) {
  if (compressed_bytes.size() != 33) {
    throw std::invalid_argument("Compressed point must be 33 bytes");
  }
  if (compressed_bytes[0] != 0x02 && compressed_bytes[0] != 0x03) {
    throw std::invalid_argument("Compressed point must start with 0x02 or 0x03");
  }

  std::array<uint8_t, 33> compressed{};
  std::copy(compressed_bytes.begin(), compressed_bytes.end(), compressed.begin());
  (void)ParsePubkey(compressed);

  ECPoint out;
  out.compressed_ = compressed;
  return out;
}

ECPoint ECPoint::GeneratorMultiply(const Scalar& scalar) {
  std::array<uint8_t, 32> scalar_bytes = scalar.ToCanonicalBytes();

  secp256k1_pubkey pubkey;
  if (secp256k1_ec_pubkey_create(SecpContext(), &pubkey, scalar_bytes.data()) != 1) {
    throw std::invalid_argument("Generator multiplication failed: scalar must be in [1, q-1]");
  }

  ECPoint out;
  out.compressed_ = SerializeCompressed(pubkey);
  return out;
}

ECPoint ECPoint::Sum(std::span<const ECPoint> points) {
  if (points.empty()) {
    throw std::invalid_argument("cannot sum an empty point set");
  }

  std::vector<secp256k1_pubkey> parsed;
  parsed.reserve(points.size());
  for (const ECPoint& point : points) {
    parsed.push_back(ParsePubkey(point.compressed_));
  }
  std::vector<const secp256k1_pubkey*> inputs;
  inputs.reserve(parsed.size());
  for (const secp256k1_pubkey& pubkey : parsed) {
    inputs.push_back(&pubkey);
  }

  secp256k1_pubkey combined;
  if (secp256k1_ec_pubkey_combine(SecpContext(), &combined, inputs.data(), inputs.size()) != 1) {
    throw std::invalid_argument("Point sum is the point at infinity");
  }

  ECPoint out;
  out.compressed_ = SerializeCompressed(combined);
  return out;
}

ECPoint ECPoint::Add(const ECPoint& other) const {
  const std::array<ECPoint, 2> pair = {*this, other};
  return Sum(pair);
}

ECPoint ECPoint::Mul(const Scalar& scalar) const {
  secp256k1_pubkey pubkey = ParsePubkey(compressed_);
  std::array<uint8_t, 32> scalar_bytes = scalar.ToCanonicalBytes();

  if (secp256k1_ec_pubkey_tweak_mul(SecpContext(), &pubkey, scalar_bytes.data()) != 1) {
    throw std::invalid_argument("Point scalar multiplication failed");
  }

  ECPoint out;
  out.compressed_ = SerializeCompressed(pubkey);
  return out;
}

ECPoint ECPoint::AddGeneratorMultiple(const Scalar& tweak) const {
  if (tweak.IsZero()) {
    return *this;
  }

  secp256k1_pubkey pubkey = ParsePubkey(compressed_);
  std::array<uint8_t, 32> tweak_bytes = tweak.ToCanonicalBytes();
  if (secp256k1_ec_pubkey_tweak_add(SecpContext(), &pubkey, tweak_bytes.data()) != 1) {
    throw std::invalid_argument("Point tweak-add produced the point at infinity");
  }

  ECPoint out;
  out.compressed_ = SerializeCompressed(pubkey);
  return out;
}

Bytes ECPoint::ToCompressedBytes() const {
  return Bytes(compressed_.begin(), compressed_.end());
}

std::string ECPoint::ToHex() const {
  return mpcrec::ToHex(compressed_);
}

bool ECPoint::operator==(const ECPoint& other) const {
  return compressed_ == other.compressed_;
}

bool ECPoint::operator!=(const ECPoint& other) const {
  return !(*this == other);
}

}  // namespace mpcrec
