#include "mpcrec/derivation/key_set.hpp"

#include <span>
#include <stdexcept>
#include <string>

#include "mpcrec/crypto/frost.hpp"

namespace mpcrec {
namespace {

ECPoint InterpolateAtZero(const KeySet& key_set, std::span<const PartyIndex> subset) {
  std::vector<ECPoint> terms;
  terms.reserve(subset.size());
  for (PartyIndex id : subset) {
    terms.push_back(key_set.VerificationShare(id).Mul(LagrangeCoefficientAtZero(id, subset)));
  }
  return ECPoint::Sum(terms);
}

}  // namespace

std::vector<PartyIndex> KeySet::participants() const {
  std::vector<PartyIndex> out;
  out.reserve(verification_shares.size());
  for (const auto& [id, share] : verification_shares) {
    (void)share;
    out.push_back(id);
  }
  return out;
}

size_t KeySet::size() const {
  return verification_shares.size();
}

bool KeySet::Contains(PartyIndex party_id) const {
  return verification_shares.contains(party_id);
}

const ECPoint& KeySet::VerificationShare(PartyIndex party_id) const {
  const auto it = verification_shares.find(party_id);
  if (it == verification_shares.end()) {
    throw std::invalid_argument("party " + std::to_string(party_id) + " is not in the key set");
  }
  return it->second;
}

void ValidateKeySet(const KeySet& key_set) {
  const std::vector<PartyIndex> ids = key_set.participants();
  if (ids.size() < 2) {
    throw std::invalid_argument("key set requires at least 2 participants");
  }
  if (key_set.threshold < 2 || key_set.threshold > ids.size()) {
    throw std::invalid_argument("key set threshold must satisfy 2 <= t <= n");
  }
  if (ids.front() == 0) {
    throw std::invalid_argument("key set participants must not contain 0");
  }

  const std::span<const PartyIndex> all(ids);
  const std::span<const PartyIndex> head = all.first(key_set.threshold);
  const std::span<const PartyIndex> tail = all.last(key_set.threshold);
  if (InterpolateAtZero(key_set, head) != key_set.group_public_key ||
      InterpolateAtZero(key_set, tail) != key_set.group_public_key) {
    throw std::invalid_argument("verification shares do not interpolate to the group key");
  }
}

void ValidateSecretShare(const KeySet& key_set, const NodeSecretShare& share) {
  if (!key_set.Contains(share.party_id)) {
    throw std::invalid_argument("secret share belongs to a party outside the key set");
  }
  if (share.share.IsZero() ||
      ECPoint::GeneratorMultiply(share.share) != key_set.VerificationShare(share.party_id)) {
    throw std::invalid_argument("secret share does not match its verification share");
  }
}

}  // namespace mpcrec
