#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>

#include "mpcrec/common/bytes.hpp"
#include "mpcrec/crypto/scalar.hpp"

namespace mpcrec {

// Non-identity secp256k1 point held in SEC1 compressed form.
class ECPoint {
 public:
  ECPoint();

  static ECPoint FromCompressed(std::span<const uint8_t> compressed_bytes);
  static ECPoint GeneratorMultiply(const Scalar& scalar);

  // Sum of all points; throws if the sum is the point at infinity.
  static ECPoint Sum(std::span<const ECPoint> points);

  ECPoint Add(const ECPoint& other) const;
  ECPoint Mul(const Scalar& scalar) const;

  // this + tweak*G; a zero tweak returns this point unchanged.
  ECPoint AddGeneratorMultiple(const Scalar& tweak) const;

  Bytes ToCompressedBytes() const;
  std::string ToHex() const;

  bool operator==(const ECPoint& other) const;
  bool operator!=(const ECPoint& other) const;

 private:
  std::array<uint8_t, 33> compressed_{};
};

}  // namespace mpcrec
