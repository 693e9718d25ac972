#pragma once

#include <array>
#include <cstdint>
#include <span>

#include <gmpxx.h>

namespace mpcrec {

// Element of the secp256k1 scalar field Z_q.
class Scalar {
 public:
  Scalar();
  explicit Scalar(const mpz_class& value);

  static Scalar FromUint64(uint64_t value);
  static Scalar FromBigEndianModQ(std::span<const uint8_t> bytes);
  static Scalar FromCanonicalBytes(std::span<const uint8_t> bytes);

  std::array<uint8_t, 32> ToCanonicalBytes() const;

  const mpz_class& value() const;
  bool IsZero() const;

  Scalar operator+(const Scalar& other) const;
  Scalar operator-(const Scalar& other) const;
  Scalar operator*(const Scalar& other) const;
  Scalar operator-() const;

  // Throws std::domain_error for zero.
  Scalar Inverse() const;

  // Overwrites the limb storage before resetting to zero.
  void Wipe() noexcept;

  bool operator==(const Scalar& other) const;
  bool operator!=(const Scalar& other) const;

  static const mpz_class& ModulusQ();

 private:
  mpz_class value_;
};

}  // namespace mpcrec
