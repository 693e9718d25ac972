#pragma once

#include <cstdint>
#include <vector>

#include "mpcrec/derivation/key_set.hpp"

namespace mpcrec {

struct DealerOutput {
  KeySet key_set;
  std::vector<NodeSecretShare> shares;
};

// Development and test provisioning only: a single process briefly knows the
// root secret. Production networks provision shares with a DKG ceremony.
// Parties are numbered 1..n.
DealerOutput GenerateTrustedDealerKeys(uint32_t n, uint32_t threshold);

}  // namespace mpcrec
