#include "mpcrec/registry/recovery_key_resolver.hpp"

#include <stdexcept>
#include <utility>

namespace mpcrec {

RecoveryKeyResolver::RecoveryKeyResolver(const RecoveryMethodRegistry* registry,
                                         std::shared_ptr<const IKeyDerivationScheme> derivation,
                                         const KeySet* key_set)
    : registry_(registry), derivation_(std::move(derivation)), key_set_(key_set) {
  if (registry_ == nullptr || !derivation_ || key_set_ == nullptr) {
    throw std::invalid_argument("RecoveryKeyResolver dependencies must not be null");
  }
}

ResolvedRecoveryKey RecoveryKeyResolver::Resolve(std::string_view account_id,
                                                 const Identity& identity) const {
  if (const auto stored = registry_->Lookup(account_id, identity); stored.has_value()) {
    return ResolvedRecoveryKey{stored->public_key, true};
  }
  return ResolvedRecoveryKey{derivation_->DerivePublicKey(*key_set_, account_id, identity), false};
}

}  // namespace mpcrec
