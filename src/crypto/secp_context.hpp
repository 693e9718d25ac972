#pragma once

extern "C" {
#include <secp256k1.h>
}

namespace mpcrec::internal {

// Process-wide context, created once and never destroyed.
secp256k1_context* SecpContext();

}  // namespace mpcrec::internal
