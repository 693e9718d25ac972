#pragma once

#include <cstdint>
#include <span>
#include <string_view>

#include "mpcrec/common/bytes.hpp"
#include "mpcrec/crypto/scalar.hpp"

namespace mpcrec {

// Unambiguous labelled encoding: every label and value is u32-length-prefixed,
// so no two field sequences share a byte representation.
class Transcript {
 public:
  void append(std::string_view label, std::span<const uint8_t> data);
  void append_ascii(std::string_view label, std::string_view ascii);
  void append_domain(std::string_view domain);

  Bytes digest() const;
  Scalar challenge_scalar(std::string_view dst) const;

 private:
  Bytes transcript_;
};

}  // namespace mpcrec
