#pragma once

#include <cstdint>
#include <map>
#include <vector>

#include "mpcrec/common/secure_zeroize.hpp"
#include "mpcrec/crypto/ec_point.hpp"
#include "mpcrec/crypto/scalar.hpp"
#include "mpcrec/protocol/types.hpp"

namespace mpcrec {

// One node's Shamir share x_j of the network root secret. Never logged,
// serialized or sent.
struct NodeSecretShare {
  PartyIndex party_id = 0;
  Scalar share;

  ~NodeSecretShare() { SecureZeroize(&share); }
};

// Public key material every node holds: Y = x*G and Y_j = x_j*G.
struct KeySet {
  uint32_t threshold = 0;
  ECPoint group_public_key;
  std::map<PartyIndex, ECPoint> verification_shares;

  std::vector<PartyIndex> participants() const;
  size_t size() const;
  bool Contains(PartyIndex party_id) const;
  const ECPoint& VerificationShare(PartyIndex party_id) const;
};

// Interpolates Y from several threshold-sized subsets of the verification
// shares; throws std::invalid_argument on any inconsistency.
void ValidateKeySet(const KeySet& key_set);

void ValidateSecretShare(const KeySet& key_set, const NodeSecretShare& share);

}  // namespace mpcrec
