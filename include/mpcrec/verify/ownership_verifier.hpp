#pragma once

#include <chrono>
#include <memory>
#include <string_view>

#include "mpcrec/common/clock.hpp"
#include "mpcrec/common/retry.hpp"
#include "mpcrec/verify/binding_message.hpp"
#include "mpcrec/verify/chain.hpp"
#include "mpcrec/verify/replay_guard.hpp"

namespace mpcrec {

struct OwnershipVerifierConfig {
  std::chrono::seconds freshness_window = std::chrono::seconds(300);
  std::chrono::seconds max_clock_skew = std::chrono::seconds(30);
  RetryPolicy retry;
  std::chrono::milliseconds call_timeout = std::chrono::milliseconds(5000);
};

// Checks, in order: freshness, nonce reuse, signature, on-chain
// authorization. A proof that passes is recorded and cannot pass again.
class OwnershipVerifier {
 public:
  OwnershipVerifier(OwnershipVerifierConfig config,
                    std::shared_ptr<IChainKeySource> chain,
                    WallClock clock = SystemWallClock(),
                    Sleeper sleeper = ThreadSleeper());

  void Verify(std::string_view account_id,
              std::string_view access_token,
              const BindingProof& proof);

  const ReplayGuard& replay_guard() const;

 private:
  OwnershipVerifierConfig config_;
  std::shared_ptr<IChainKeySource> chain_;
  WallClock clock_;
  Sleeper sleeper_;
  ReplayGuard replay_guard_;
};

}  // namespace mpcrec
