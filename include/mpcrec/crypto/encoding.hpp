#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "mpcrec/common/bytes.hpp"
#include "mpcrec/crypto/scalar.hpp"

namespace mpcrec {

class ECPoint;

constexpr size_t kPointCompressedLen = 33;
constexpr size_t kScalarLen = 32;

// Big-endian, length-prefixed wire writer shared by every payload codec.
class ByteWriter {
 public:
  void WriteU8(uint8_t value);
  void WriteU32(uint32_t value);
  void WriteU64(uint64_t value);
  void WriteSized(std::span<const uint8_t> field);
  void WriteString(std::string_view value);
  void WritePoint(const ECPoint& point);
  void WriteScalar(const Scalar& scalar);

  const Bytes& bytes() const;
  Bytes Take();

 private:
  Bytes out_;
};

// Every read throws std::invalid_argument on truncation or an oversized field.
class ByteReader {
 public:
  explicit ByteReader(std::span<const uint8_t> input);

  uint8_t ReadU8();
  uint32_t ReadU32();
  uint64_t ReadU64();
  Bytes ReadSized(size_t max_len, const char* field_name);
  std::string ReadString(size_t max_len, const char* field_name);
  ECPoint ReadPoint();
  Scalar ReadScalar();

  bool AtEnd() const;
  void ExpectEnd(const char* what) const;

 private:
  std::span<const uint8_t> input_;
  size_t offset_ = 0;
};

std::string ToHex(std::span<const uint8_t> data);
Bytes FromHex(std::string_view hex);

}  // namespace mpcrec
