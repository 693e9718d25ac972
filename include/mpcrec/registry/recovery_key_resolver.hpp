#pragma once

#include <memory>
#include <string_view>

#include "mpcrec/crypto/ec_point.hpp"
#include "mpcrec/derivation/key_derivation.hpp"
#include "mpcrec/derivation/key_set.hpp"
#include "mpcrec/registry/recovery_method_registry.hpp"

namespace mpcrec {

struct ResolvedRecoveryKey {
  ECPoint public_key;
  bool stored = false;
};

// A stored key always wins over a fresh derivation, so a change to the share
// set can never silently move an existing user's recovery key.
class RecoveryKeyResolver {
 public:
  RecoveryKeyResolver(const RecoveryMethodRegistry* registry,
                      std::shared_ptr<const IKeyDerivationScheme> derivation,
                      const KeySet* key_set);

  ResolvedRecoveryKey Resolve(std::string_view account_id, const Identity& identity) const;

 private:
  const RecoveryMethodRegistry* registry_;
  std::shared_ptr<const IKeyDerivationScheme> derivation_;
  const KeySet* key_set_;
};

}  // namespace mpcrec
