#pragma once

#include <cstddef>
#include <span>
#include <string_view>

#include "mpcrec/common/bytes.hpp"
#include "mpcrec/crypto/scalar.hpp"

namespace mpcrec {

Bytes Sha256(std::span<const uint8_t> data);

// RFC 9380 expand_message_xmd instantiated with SHA-256.
Bytes ExpandMessageXmd(std::span<const uint8_t> message,
                       std::string_view dst,
                       size_t len_in_bytes);

// RFC 9380 hash_to_field for the secp256k1 scalar field (L = 48, m = 1).
Scalar HashToScalar(std::span<const uint8_t> message, std::string_view dst);

}  // namespace mpcrec
