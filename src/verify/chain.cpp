#include "mpcrec/verify/chain.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "mpcrec/common/errors.hpp"
#include "mpcrec/common/logging.hpp"
#include "mpcrec/protocol/messages.hpp"

namespace mpcrec {

void InMemoryChain::CreateAccount(const std::string& account_id, const ECPoint& initial_key) {
  std::lock_guard<std::mutex> lock(mu_);
  if (accounts_.contains(account_id)) {
    throw std::invalid_argument("account already exists: " + account_id);
  }
  accounts_[account_id].push_back(initial_key);
}

void InMemoryChain::AddKey(const std::string& account_id, const ECPoint& key) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = accounts_.find(account_id);
  if (it == accounts_.end()) {
    throw std::invalid_argument("unknown account: " + account_id);
  }
  if (std::find(it->second.begin(), it->second.end(), key) == it->second.end()) {
    it->second.push_back(key);
  }
}

bool InMemoryChain::RemoveKey(const std::string& account_id, const ECPoint& key) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = accounts_.find(account_id);
  if (it == accounts_.end()) {
    return false;
  }
  const auto key_it = std::find(it->second.begin(), it->second.end(), key);
  if (key_it == it->second.end()) {
    return false;
  }
  it->second.erase(key_it);
  return true;
}

bool InMemoryChain::HasKey(std::string_view account_id, const ECPoint& key) const {
  std::lock_guard<std::mutex> lock(mu_);
  return HasKeyLocked(account_id, key);
}

void InMemoryChain::SetUnreachable(bool unreachable) {
  std::lock_guard<std::mutex> lock(mu_);
  unreachable_ = unreachable;
}

void InMemoryChain::FailNextCalls(size_t count) {
  std::lock_guard<std::mutex> lock(mu_);
  failures_remaining_ = count;
}

std::vector<ECPoint> InMemoryChain::FetchAuthorizedKeys(std::string_view account_id,
                                                        std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> lock(mu_);
  CheckReachableLocked(timeout);
  const auto it = accounts_.find(account_id);
  if (it == accounts_.end()) {
    return {};
  }
  return it->second;
}

void InMemoryChain::SubmitKeyAddition(const Bytes& payload,
                                      const Signature& signature,
                                      const ECPoint& signing_key) {
  KeyAddition addition;
  try {
    addition = ParseKeyAdditionMessage(payload);
  } catch (const std::invalid_argument& ex) {
    throw RecoveryError(ErrorCode::kInvalidRequest, std::string("malformed key addition: ") + ex.what());
  }
  if (addition.kind != RequestKind::kRecoverAccount) {
    throw RecoveryError(ErrorCode::kInvalidRequest, "only recovery key additions can be submitted");
  }
  if (!VerifySignature(signing_key, payload, signature)) {
    throw RecoveryError(ErrorCode::kInvalidSignature, "key addition signature does not verify");
  }

  std::lock_guard<std::mutex> lock(mu_);
  CheckReachableLocked(std::chrono::milliseconds(0));
  if (!HasKeyLocked(addition.account_id, signing_key)) {
    throw RecoveryError(ErrorCode::kUnauthorizedKey,
                        "signing key is not authorized on " + addition.account_id);
  }
  auto& keys = accounts_[addition.account_id];
  if (std::find(keys.begin(), keys.end(), addition.public_key) == keys.end()) {
    keys.push_back(addition.public_key);
  }
  Log()->info("chain: added key {} to {}", addition.public_key.ToHex(), addition.account_id);
}

void InMemoryChain::CheckReachableLocked(std::chrono::milliseconds timeout) {
  if (unreachable_ || failures_remaining_ > 0) {
    if (failures_remaining_ > 0) {
      --failures_remaining_;
    }
    throw RecoveryError(ErrorCode::kProviderUnreachable,
                        "chain endpoint did not answer within " + std::to_string(timeout.count()) + " ms");
  }
}

bool InMemoryChain::HasKeyLocked(std::string_view account_id, const ECPoint& key) const {
  const auto it = accounts_.find(account_id);
  return it != accounts_.end() &&
         std::find(it->second.begin(), it->second.end(), key) != it->second.end();
}

}  // namespace mpcrec
