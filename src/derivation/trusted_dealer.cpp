#include "mpcrec/derivation/trusted_dealer.hpp"

#include <stdexcept>

#include "mpcrec/crypto/random.hpp"

namespace mpcrec {
namespace {

Scalar EvaluatePolynomialAt(const std::vector<Scalar>& coefficients, PartyIndex party_id) {
  if (coefficients.empty()) {
    throw std::invalid_argument("Polynomial coefficients must not be empty");
  }

  const Scalar x = Scalar::FromUint64(party_id);
  Scalar acc;
  for (auto it = coefficients.rbegin(); it != coefficients.rend(); ++it) {
    acc = acc * x + *it;
  }
  return acc;
}

}  // namespace

DealerOutput GenerateTrustedDealerKeys(uint32_t n, uint32_t threshold) {
  if (n < 2) {
    throw std::invalid_argument("dealer requires at least 2 parties");
  }
  if (threshold < 2 || threshold > n) {
    throw std::invalid_argument("dealer threshold must satisfy 2 <= t <= n");
  }

  std::vector<Scalar> coefficients;
  coefficients.reserve(threshold);
  for (uint32_t i = 0; i < threshold; ++i) {
    coefficients.push_back(Csprng::RandomNonZeroScalar());
  }

  DealerOutput out;
  out.key_set.threshold = threshold;
  out.key_set.group_public_key = ECPoint::GeneratorMultiply(coefficients.front());
  out.shares.reserve(n);
  for (PartyIndex id = 1; id <= n; ++id) {
    Scalar share = EvaluatePolynomialAt(coefficients, id);
    if (share.IsZero()) {
      throw std::runtime_error("dealer produced a zero share; retry generation");
    }
    out.key_set.verification_shares.emplace(id, ECPoint::GeneratorMultiply(share));
    out.shares.push_back(NodeSecretShare{id, share});
    share.Wipe();
  }

  for (Scalar& coefficient : coefficients) {
    coefficient.Wipe();
  }
  return out;
}

}  // namespace mpcrec
