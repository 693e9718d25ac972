#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

#include "mpcrec/common/clock.hpp"
#include "mpcrec/common/errors.hpp"
#include "mpcrec/crypto/ec_point.hpp"
#include "mpcrec/registry/recovery_method_store.hpp"

namespace mpcrec {

enum class RegisterOutcome {
  kCreated,
  kAlreadyPresent,
};

// AlreadyExists carrying the key that won.
class RecoveryMethodExistsError : public RecoveryError {
 public:
  RecoveryMethodExistsError(const ECPoint& stored_public_key, const std::string& detail);

  const ECPoint& stored_public_key() const;

 private:
  ECPoint stored_public_key_;
};

// First writer wins per (account, identity). Writers for the same key
// serialize on a lock stripe; different keys proceed in parallel.
class RecoveryMethodRegistry {
 public:
  explicit RecoveryMethodRegistry(std::shared_ptr<IRecoveryMethodStore> store,
                                  WallClock clock = SystemWallClock(),
                                  size_t lock_stripes = 64);

  // Idempotent for the same key; throws RecoveryMethodExistsError when a
  // different key is stored.
  RegisterOutcome Register(std::string_view account_id,
                           const Identity& identity,
                           const ECPoint& public_key);

  std::optional<RecoveryMethod> Lookup(std::string_view account_id,
                                       const Identity& identity) const;

  bool Revoke(std::string_view account_id, const Identity& identity);

 private:
  std::mutex& StripeFor(std::string_view account_id, const Identity& identity) const;

  std::shared_ptr<IRecoveryMethodStore> store_;
  WallClock clock_;
  mutable std::vector<std::mutex> stripes_;
};

}  // namespace mpcrec
