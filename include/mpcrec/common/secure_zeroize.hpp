#pragma once

#include <cstddef>
#include <cstdint>

#include "mpcrec/common/bytes.hpp"
#include "mpcrec/crypto/scalar.hpp"

namespace mpcrec {

inline void SecureZeroizeMemory(void* data, size_t size) noexcept {
  if (data == nullptr || size == 0) {
    return;
  }

  volatile uint8_t* ptr = static_cast<volatile uint8_t*>(data);
  while (size > 0) {
    *ptr = 0;
    ++ptr;
    --size;
  }
}

inline void SecureZeroize(Bytes* value) noexcept {
  if (value == nullptr) {
    return;
  }
  if (!value->empty()) {
    SecureZeroizeMemory(value->data(), value->size());
  }
  value->clear();
}

inline void SecureZeroize(Scalar* value) noexcept {
  if (value == nullptr) {
    return;
  }
  value->Wipe();
}

}  // namespace mpcrec
