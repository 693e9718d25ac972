#include "mpcrec/registry/recovery_method_registry.hpp"

#include <functional>
#include <stdexcept>
#include <string>
#include <utility>

#include "mpcrec/common/logging.hpp"

namespace mpcrec {

RecoveryMethodExistsError::RecoveryMethodExistsError(const ECPoint& stored_public_key,
                                                     const std::string& detail)
    : RecoveryError(ErrorCode::kAlreadyExists, detail), stored_public_key_(stored_public_key) {}

const ECPoint& RecoveryMethodExistsError::stored_public_key() const {
  return stored_public_key_;
}

RecoveryMethodRegistry::RecoveryMethodRegistry(std::shared_ptr<IRecoveryMethodStore> store,
                                               WallClock clock,
                                               size_t lock_stripes)
    : store_(std::move(store)), clock_(std::move(clock)), stripes_(lock_stripes) {
  if (!store_) {
    throw std::invalid_argument("registry store must not be null");
  }
  if (!clock_) {
    throw std::invalid_argument("registry clock must not be empty");
  }
  if (lock_stripes == 0) {
    throw std::invalid_argument("registry lock_stripes must be > 0");
  }
}

RegisterOutcome RecoveryMethodRegistry::Register(std::string_view account_id,
                                                 const Identity& identity,
                                                 const ECPoint& public_key) {
  if (account_id.empty()) {
    throw std::invalid_argument("account_id must not be empty");
  }
  ValidateIdentity(identity);

  std::lock_guard<std::mutex> lock(StripeFor(account_id, identity));

  RecoveryMethod candidate;
  candidate.account_id = std::string(account_id);
  candidate.identity = identity;
  candidate.public_key = public_key;
  candidate.created_at = ToUnixSeconds(clock_());

  bool inserted = false;
  const RecoveryMethod stored = store_->InsertIfAbsent(candidate, &inserted);
  if (inserted) {
    Log()->info("registered recovery method for {} / {}", account_id, identity.ToString());
    return RegisterOutcome::kCreated;
  }
  if (stored.public_key == public_key) {
    return RegisterOutcome::kAlreadyPresent;
  }
  throw RecoveryMethodExistsError(
      stored.public_key,
      "recovery method for " + std::string(account_id) + " / " + identity.ToString() +
          " is already bound to " + stored.public_key.ToHex());
}

std::optional<RecoveryMethod> RecoveryMethodRegistry::Lookup(std::string_view account_id,
                                                             const Identity& identity) const {
  return store_->Lookup(account_id, identity);
}

bool RecoveryMethodRegistry::Revoke(std::string_view account_id, const Identity& identity) {
  std::lock_guard<std::mutex> lock(StripeFor(account_id, identity));
  const bool removed = store_->Remove(account_id, identity);
  if (removed) {
    Log()->info("revoked recovery method for {} / {}", account_id, identity.ToString());
  }
  return removed;
}

std::mutex& RecoveryMethodRegistry::StripeFor(std::string_view account_id,
                                              const Identity& identity) const {
  const std::string key = std::string(account_id) + '\n' + identity.ToString();
  return stripes_[std::hash<std::string>{}(key) % stripes_.size()];
}

}  // namespace mpcrec
