#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "mpcrec/common/clock.hpp"
#include "mpcrec/common/retry.hpp"
#include "mpcrec/protocol/types.hpp"
#include "mpcrec/verify/identity_provider.hpp"

namespace mpcrec {

constexpr size_t kMaxAccessTokenLen = 8 * 1024;

struct IdentityVerifierConfig {
  // Accepted token issuers; the issuer becomes Identity::provider.
  std::vector<std::string> trusted_providers;
  std::string audience;
  std::chrono::seconds max_clock_skew = std::chrono::seconds(30);
  RetryPolicy retry;
  std::chrono::milliseconds call_timeout = std::chrono::milliseconds(5000);
};

class IdentityVerifier {
 public:
  IdentityVerifier(IdentityVerifierConfig config,
                   std::shared_ptr<IIdentityProvider> provider,
                   WallClock clock = SystemWallClock(),
                   Sleeper sleeper = ThreadSleeper());

  // Throws RecoveryError(kInvalidToken) for any rejected token, and
  // RecoveryError(kProviderUnreachable) once retries are exhausted.
  Identity Verify(std::string_view access_token,
                  const std::optional<Identity>& expected_identity = std::nullopt) const;

 private:
  bool IsTrustedProvider(std::string_view issuer) const;

  IdentityVerifierConfig config_;
  std::shared_ptr<IIdentityProvider> provider_;
  WallClock clock_;
  Sleeper sleeper_;
};

}  // namespace mpcrec
