#include "mpcrec/verify/identity_verifier.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "mpcrec/common/errors.hpp"
#include "mpcrec/common/logging.hpp"

namespace mpcrec {

IdentityVerifier::IdentityVerifier(IdentityVerifierConfig config,
                                   std::shared_ptr<IIdentityProvider> provider,
                                   WallClock clock,
                                   Sleeper sleeper)
    : config_(std::move(config)),
      provider_(std::move(provider)),
      clock_(std::move(clock)),
      sleeper_(std::move(sleeper)) {
  if (!provider_) {
    throw std::invalid_argument("identity provider must not be null");
  }
  if (!clock_ || !sleeper_) {
    throw std::invalid_argument("identity verifier clock and sleeper must be set");
  }
  if (config_.trusted_providers.empty()) {
    throw std::invalid_argument("at least one trusted provider is required");
  }
  for (const std::string& provider_name : config_.trusted_providers) {
    if (provider_name.empty() || provider_name.find(':') != std::string::npos) {
      throw std::invalid_argument("trusted provider names must be non-empty and contain no ':'");
    }
  }
  if (config_.audience.empty()) {
    throw std::invalid_argument("audience must not be empty");
  }
  if (config_.max_clock_skew.count() < 0 || config_.call_timeout.count() <= 0) {
    throw std::invalid_argument("identity verifier timing parameters are invalid");
  }
  ValidateRetryPolicy(config_.retry);
}

Identity IdentityVerifier::Verify(std::string_view access_token,
                                  const std::optional<Identity>& expected_identity) const {
  if (access_token.empty() || access_token.size() > kMaxAccessTokenLen) {
    throw RecoveryError(ErrorCode::kInvalidToken, "access token is empty or too long");
  }

  const TokenClaims claims = RetryWithBackoff(
      config_.retry, "token introspection",
      [&]() { return provider_->Introspect(access_token, config_.call_timeout); }, sleeper_);

  if (!IsTrustedProvider(claims.issuer)) {
    throw RecoveryError(ErrorCode::kInvalidToken, "token issuer '" + claims.issuer + "' is not trusted");
  }
  if (claims.audience != config_.audience) {
    throw RecoveryError(ErrorCode::kInvalidToken, "token audience does not match");
  }
  if (claims.subject.empty()) {
    throw RecoveryError(ErrorCode::kInvalidToken, "token has no subject");
  }

  const uint64_t now = ToUnixSeconds(clock_());
  const uint64_t skew = static_cast<uint64_t>(config_.max_clock_skew.count());
  if (now >= claims.expires_at) {
    throw RecoveryError(ErrorCode::kInvalidToken, "token has expired");
  }
  if (claims.issued_at > now + skew) {
    throw RecoveryError(ErrorCode::kInvalidToken, "token is issued in the future");
  }

  Identity identity{claims.issuer, claims.subject};
  if (expected_identity.has_value() && *expected_identity != identity) {
    throw RecoveryError(ErrorCode::kInvalidToken,
                        "token identity " + identity.ToString() + " does not match the claimed identity");
  }
  Log()->debug("verified token for {}", identity.ToString());
  return identity;
}

bool IdentityVerifier::IsTrustedProvider(std::string_view issuer) const {
  return std::find(config_.trusted_providers.begin(), config_.trusted_providers.end(), issuer) !=
         config_.trusted_providers.end();
}

}  // namespace mpcrec
