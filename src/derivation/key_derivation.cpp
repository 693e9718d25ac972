#include "mpcrec/derivation/key_derivation.hpp"

#include <stdexcept>
#include <vector>

#include "mpcrec/crypto/frost.hpp"
#include "mpcrec/crypto/transcript.hpp"

namespace mpcrec {
namespace {

constexpr char kDerivationDomain[] = "mpcrec/derive/v1";
constexpr char kDerivationDst[] = "mpcrec-derive-v1";

void ValidateAccountId(std::string_view account_id) {
  if (account_id.empty()) {
    throw std::invalid_argument("account_id must not be empty");
  }
}

}  // namespace

Scalar ShamirAdditiveDerivation::Tweak(std::string_view account_id,
                                       const Identity& identity) const {
  ValidateAccountId(account_id);
  ValidateIdentity(identity);

  Transcript transcript;
  transcript.append_domain(kDerivationDomain);
  transcript.append_ascii("account", account_id);
  transcript.append_ascii("provider", identity.provider);
  transcript.append_ascii("subject", identity.subject);
  return transcript.challenge_scalar(kDerivationDst);
}

ECPoint ShamirAdditiveDerivation::DeriveShare(const NodeSecretShare& share,
                                              std::string_view account_id,
                                              const Identity& identity) const {
  Scalar derived = share.share + Tweak(account_id, identity);
  const ECPoint out = ECPoint::GeneratorMultiply(derived);
  derived.Wipe();
  return out;
}

ECPoint ShamirAdditiveDerivation::DerivePublicKey(const KeySet& key_set,
                                                  std::string_view account_id,
                                                  const Identity& identity) const {
  return key_set.group_public_key.AddGeneratorMultiple(Tweak(account_id, identity));
}

ECPoint ShamirAdditiveDerivation::CombineShares(
    const KeySet& key_set,
    const std::map<PartyIndex, ECPoint>& partial_public_keys) const {
  if (partial_public_keys.size() < key_set.threshold) {
    throw std::invalid_argument("not enough partial public keys to combine");
  }

  std::vector<PartyIndex> ids;
  ids.reserve(partial_public_keys.size());
  for (const auto& [id, partial] : partial_public_keys) {
    (void)partial;
    if (!key_set.Contains(id)) {
      throw std::invalid_argument("partial public key from a party outside the key set");
    }
    ids.push_back(id);
  }

  std::vector<ECPoint> terms;
  terms.reserve(ids.size());
  for (const auto& [id, partial] : partial_public_keys) {
    terms.push_back(partial.Mul(LagrangeCoefficientAtZero(id, ids)));
  }
  return ECPoint::Sum(terms);
}

std::shared_ptr<const IKeyDerivationScheme> DefaultKeyDerivationScheme() {
  static const std::shared_ptr<const IKeyDerivationScheme> scheme =
      std::make_shared<ShamirAdditiveDerivation>();
  return scheme;
}

}  // namespace mpcrec
