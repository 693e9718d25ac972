#include "mpcrec/crypto/transcript.hpp"

#include <stdexcept>

#include "mpcrec/crypto/hash.hpp"

namespace mpcrec {
namespace {

void AppendU32Be(uint32_t value, Bytes* out) {
  out->push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
  out->push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
  out->push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
  out->push_back(static_cast<uint8_t>(value & 0xFF));
}

}  // namespace

void Transcript::append(std::string_view label, std::span<const uint8_t> data) {
  if (label.size() > UINT32_MAX || data.size() > UINT32_MAX) {
    throw std::invalid_argument("Transcript field exceeds uint32 length");
  }

  AppendU32Be(static_cast<uint32_t>(label.size()), &transcript_);
  transcript_.insert(transcript_.end(), label.begin(), label.end());

  AppendU32Be(static_cast<uint32_t>(data.size()), &transcript_);
  transcript_.insert(transcript_.end(), data.begin(), data.end());
}

void Transcript::append_ascii(std::string_view label, std::string_view ascii) {
  append(label, AsByteSpan(ascii));
}

void Transcript::append_domain(std::string_view domain) {
  append_ascii("domain", domain);
}

Bytes Transcript::digest() const {
  return Sha256(transcript_);
}

Scalar Transcript::challenge_scalar(std::string_view dst) const {
  return HashToScalar(transcript_, dst);
}

}  // namespace mpcrec
