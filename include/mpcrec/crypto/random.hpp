#pragma once

#include <cstddef>

#include "mpcrec/common/bytes.hpp"
#include "mpcrec/crypto/scalar.hpp"

namespace mpcrec {

class Csprng {
 public:
  static Bytes RandomBytes(size_t size);
  static Scalar RandomScalar();
  static Scalar RandomNonZeroScalar();
};

}  // namespace mpcrec
