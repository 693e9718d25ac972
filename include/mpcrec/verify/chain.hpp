#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "mpcrec/common/bytes.hpp"
#include "mpcrec/crypto/ec_point.hpp"
#include "mpcrec/crypto/frost.hpp"

namespace mpcrec {

// Read-only view of the keys currently authorized on an account. Throws
// RecoveryError(kProviderUnreachable) when the chain endpoint cannot answer.
class IChainKeySource {
 public:
  virtual ~IChainKeySource() = default;

  virtual std::vector<ECPoint> FetchAuthorizedKeys(std::string_view account_id,
                                                   std::chrono::milliseconds timeout) = 0;
};

// Accepts a co-signed key-addition payload for inclusion on chain.
class IChainSubmitter {
 public:
  virtual ~IChainSubmitter() = default;

  virtual void SubmitKeyAddition(const Bytes& payload,
                                 const Signature& signature,
                                 const ECPoint& signing_key) = 0;
};

// Process-local ledger of account keys.
class InMemoryChain final : public IChainKeySource, public IChainSubmitter {
 public:
  void CreateAccount(const std::string& account_id, const ECPoint& initial_key);
  void AddKey(const std::string& account_id, const ECPoint& key);
  bool RemoveKey(const std::string& account_id, const ECPoint& key);
  bool HasKey(std::string_view account_id, const ECPoint& key) const;

  void SetUnreachable(bool unreachable);
  void FailNextCalls(size_t count);

  std::vector<ECPoint> FetchAuthorizedKeys(std::string_view account_id,
                                           std::chrono::milliseconds timeout) override;

  // The signing key must already be authorized on the payload's account and
  // the signature must verify; throws RecoveryError otherwise.
  void SubmitKeyAddition(const Bytes& payload,
                         const Signature& signature,
                         const ECPoint& signing_key) override;

 private:
  void CheckReachableLocked(std::chrono::milliseconds timeout);
  bool HasKeyLocked(std::string_view account_id, const ECPoint& key) const;

  mutable std::mutex mu_;
  std::map<std::string, std::vector<ECPoint>, std::less<>> accounts_;
  bool unreachable_ = false;
  size_t failures_remaining_ = 0;
};

}  // namespace mpcrec
