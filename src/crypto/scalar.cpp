#include "mpcrec/crypto/scalar.hpp"

#include <algorithm>
#include <stdexcept>

namespace mpcrec {
namespace {

const mpz_class kSecp256k1Order(
    "0xFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEBAAEDCE6AF48A03BBFD25E8CD0364141");

mpz_class NormalizeToQ(const mpz_class& input) {
  mpz_class normalized = input % kSecp256k1Order;
  if (normalized < 0) {
    normalized += kSecp256k1Order;
  }
  return normalized;
}

mpz_class ImportBigEndian(std::span<const uint8_t> bytes) {
  if (bytes.empty()) {
    throw std::invalid_argument("Big-endian input must not be empty");
  }

  mpz_class out;
  mpz_import(out.get_mpz_t(), bytes.size(), 1, sizeof(uint8_t), 1, 0, bytes.data());
  return out;
}

}  // namespace

Scalar::Scalar() : value_(0) {}

Scalar::Scalar(const mpz_class& value) : value_(NormalizeToQ(value)) {}

Scalar Scalar::FromUint64(uint64_t value) {
  mpz_class out;
  mpz_import(out.get_mpz_t(), 1, 1, sizeof(value), 0, 0, &value);
  return Scalar(out);
}

Scalar Scalar::FromBigEndianModQ(std::span<const uint8_t> bytes) {
  return Scalar(ImportBigEndian(bytes));
}

Scalar Scalar::FromCanonicalBytes(std::span<const uint8_t> bytes) {
  if (bytes.size() != 32) {
    throw std::invalid_argument("Canonical scalar must be exactly 32 bytes");
  }

  mpz_class imported = ImportBigEndian(bytes);
  if (imported >= kSecp256k1Order) {
    throw std::invalid_argument("Canonical scalar is out of range");
  }
  return Scalar(imported);
}

std::array<uint8_t, 32> Scalar::ToCanonicalBytes() const {
  std::array<uint8_t, 32> out{};

  if (value_ == 0) {
    return out;
  }

  size_t count = 0;
  mpz_export(out.data(), &count, 1, sizeof(uint8_t), 1, 0, value_.get_mpz_t());
  if (count > out.size()) {
    throw std::runtime_error("Scalar is larger than 32 bytes");
  }

  const size_t offset = out.size() - count;
  std::rotate(out.begin(), out.begin() + count, out.end());
  std::fill(out.begin(), out.begin() + offset, 0);
  return out;
}

const mpz_class& Scalar::value() const {
  return value_;
}

bool Scalar::IsZero() const {
  return value_ == 0;
}

Scalar Scalar::operator+(const Scalar& other) const {
  return Scalar(value_ + other.value_);
}

Scalar Scalar::operator-(const Scalar& other) const {
  return Scalar(value_ - other.value_);
}

Scalar Scalar::operator*(const Scalar& other) const {
  return Scalar(value_ * other.value_);
}

Scalar Scalar::operator-() const {
  return Scalar(-value_);
}

Scalar Scalar::Inverse() const {
  if (value_ == 0) {
    throw std::domain_error("zero scalar has no inverse");
  }
  mpz_class inverse;
  if (mpz_invert(inverse.get_mpz_t(), value_.get_mpz_t(), kSecp256k1Order.get_mpz_t()) == 0) {
    throw std::domain_error("scalar is not invertible mod q");
  }
  return Scalar(inverse);
}

void Scalar::Wipe() noexcept {
  const size_t limbs = mpz_size(value_.get_mpz_t());
  if (limbs > 0) {
    volatile mp_limb_t* data = mpz_limbs_modify(value_.get_mpz_t(), static_cast<mp_size_t>(limbs));
    for (size_t i = 0; i < limbs; ++i) {
      data[i] = 0;
    }
    mpz_limbs_finish(value_.get_mpz_t(), 0);
  }
  value_ = 0;
}

bool Scalar::operator==(const Scalar& other) const {
  return value_ == other.value_;
}

bool Scalar::operator!=(const Scalar& other) const {
  return !(*this == other);
}

const mpz_class& Scalar::ModulusQ() {
  return kSecp256k1Order;
}

}  // namespace mpcrec
