#include "mpcrec/crypto/encoding.hpp"

#include <stdexcept>
#include <utility>

#include "mpcrec/crypto/ec_point.hpp"

namespace mpcrec {
namespace {

int HexNibble(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

}  // namespace

void ByteWriter::WriteU8(uint8_t value) {
  out_.push_back(value);
}

void ByteWriter::WriteU32(uint32_t value) {
  out_.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
  out_.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
  out_.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
  out_.push_back(static_cast<uint8_t>(value & 0xFF));
}

void ByteWriter::WriteU64(uint64_t value) {
  WriteU32(static_cast<uint32_t>(value >> 32));
  WriteU32(static_cast<uint32_t>(value & 0xFFFFFFFFu));
}

void ByteWriter::WriteSized(std::span<const uint8_t> field) {
  if (field.size() > UINT32_MAX) {
    throw std::invalid_argument("Sized field exceeds uint32 length");
  }
  WriteU32(static_cast<uint32_t>(field.size()));
  out_.insert(out_.end(), field.begin(), field.end());
}

void ByteWriter::WriteString(std::string_view value) {
  WriteSized(AsByteSpan(value));
}

void ByteWriter::WritePoint(const ECPoint& point) {
  const Bytes encoded = point.ToCompressedBytes();
  out_.insert(out_.end(), encoded.begin(), encoded.end());
}

void ByteWriter::WriteScalar(const Scalar& scalar) {
  const auto encoded = scalar.ToCanonicalBytes();
  out_.insert(out_.end(), encoded.begin(), encoded.end());
}

const Bytes& ByteWriter::bytes() const {
  return out_;
}

Bytes ByteWriter::Take() {
  return std::move(out_);
}

ByteReader::ByteReader(std::span<const uint8_t> input) : input_(input) {}

uint8_t ByteReader::ReadU8() {
  if (offset_ + 1 > input_.size()) {
    throw std::invalid_argument("Not enough bytes to read u8");
  }
  return input_[offset_++];
}

uint32_t ByteReader::ReadU32() {
  if (offset_ + 4 > input_.size()) {
    throw std::invalid_argument("Not enough bytes to read u32");
  }

  const size_t i = offset_;
  offset_ += 4;
  return (static_cast<uint32_t>(input_[i]) << 24) |
         (static_cast<uint32_t>(input_[i + 1]) << 16) |
         (static_cast<uint32_t>(input_[i + 2]) << 8) |
         static_cast<uint32_t>(input_[i + 3]);
}

uint64_t ByteReader::ReadU64() {
  const uint64_t high = ReadU32();
  const uint64_t low = ReadU32();
  return (high << 32) | low;
}

Bytes ByteReader::ReadSized(size_t max_len, const char* field_name) {
  const uint32_t len = ReadU32();
  if (len > max_len) {
    throw std::invalid_argument(std::string(field_name) + " exceeds maximum length");
  }
  if (offset_ + len > input_.size()) {
    throw std::invalid_argument(std::string(field_name) + " has inconsistent length");
  }

  Bytes out(input_.begin() + static_cast<std::ptrdiff_t>(offset_),
            input_.begin() + static_cast<std::ptrdiff_t>(offset_ + len));
  offset_ += len;
  return out;
}

std::string ByteReader::ReadString(size_t max_len, const char* field_name) {
  const Bytes raw = ReadSized(max_len, field_name);
  return std::string(raw.begin(), raw.end());
}

ECPoint ByteReader::ReadPoint() {
  if (offset_ + kPointCompressedLen > input_.size()) {
    throw std::invalid_argument("Not enough bytes for compressed secp256k1 point");
  }
  const std::span<const uint8_t> view = input_.subspan(offset_, kPointCompressedLen);
  offset_ += kPointCompressedLen;
  return ECPoint::FromCompressed(view);
}

Scalar ByteReader::ReadScalar() {
  if (offset_ + kScalarLen > input_.size()) {
    throw std::invalid_argument("Not enough bytes for scalar");
  }
  const std::span<const uint8_t> view = input_.subspan(offset_, kScalarLen);
  offset_ += kScalarLen;
  return Scalar::FromCanonicalBytes(view);
}

bool ByteReader::AtEnd() const {
  return offset_ == input_.size();
}

void ByteReader::ExpectEnd(const char* what) const {
  if (!AtEnd()) {
    throw std::invalid_argument(std::string(what) + " has trailing bytes");
  }
}

std::string ToHex(std::span<const uint8_t> data) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(data.size() * 2);
  for (uint8_t byte : data) {
    out.push_back(kDigits[byte >> 4]);
    out.push_back(kDigits[byte & 0x0F]);
  }
  return out;
}

Bytes FromHex(std::string_view hex) {
  if (hex.size() % 2 != 0) {
    throw std::invalid_argument("hex string must have even length");
  }
  Bytes out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    const int high = HexNibble(hex[i]);
    const int low = HexNibble(hex[i + 1]);
    if (high < 0 || low < 0) {
      throw std::invalid_argument("invalid hex digit");
    }
    out.push_back(static_cast<uint8_t>((high << 4) | low));
  }
  return out;
}

}  // namespace mpcrec
