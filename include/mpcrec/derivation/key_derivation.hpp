#pragma once

#include <map>
#include <memory>
#include <string_view>

#include "mpcrec/crypto/ec_point.hpp"
#include "mpcrec/crypto/scalar.hpp"
#include "mpcrec/derivation/key_set.hpp"
#include "mpcrec/protocol/types.hpp"

namespace mpcrec {

// Threshold key derivation seam. Implementations must be pure: identical
// inputs give identical outputs across processes and restarts.
class IKeyDerivationScheme {
 public:
  virtual ~IKeyDerivationScheme() = default;

  // Public per-(account, identity) offset applied to every share.
  virtual Scalar Tweak(std::string_view account_id, const Identity& identity) const = 0;

  // This node's partial recovery public key.
  virtual ECPoint DeriveShare(const NodeSecretShare& share,
                              std::string_view account_id,
                              const Identity& identity) const = 0;

  // Full recovery public key, computable from public data alone.
  virtual ECPoint DerivePublicKey(const KeySet& key_set,
                                  std::string_view account_id,
                                  const Identity& identity) const = 0;

  // Interpolates at least `threshold` partial public keys.
  virtual ECPoint CombineShares(const KeySet& key_set,
                                const std::map<PartyIndex, ECPoint>& partial_public_keys) const = 0;
};

// Shamir shares of the root secret x with the additive tweak
// eps = hash_to_field(account, identity): node j holds x_j + eps and the
// recovery key is Y + eps*G. No partial reveals x + eps.
class ShamirAdditiveDerivation final : public IKeyDerivationScheme {
 public:
  Scalar Tweak(std::string_view account_id, const Identity& identity) const override;
  ECPoint DeriveShare(const NodeSecretShare& share,
                      std::string_view account_id,
                      const Identity& identity) const override;
  ECPoint DerivePublicKey(const KeySet& key_set,
                          std::string_view account_id,
                          const Identity& identity) const override;
  ECPoint CombineShares(const KeySet& key_set,
                        const std::map<PartyIndex, ECPoint>& partial_public_keys) const override;
};

std::shared_ptr<const IKeyDerivationScheme> DefaultKeyDerivationScheme();

}  // namespace mpcrec
