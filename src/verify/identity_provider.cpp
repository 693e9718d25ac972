#include "mpcrec/verify/identity_provider.hpp"

#include <utility>

#include "mpcrec/common/errors.hpp"

namespace mpcrec {

void StaticIdentityProvider::Issue(std::string access_token, TokenClaims claims) {
  std::lock_guard<std::mutex> lock(mu_);
  tokens_[std::move(access_token)] = std::move(claims);
}

void StaticIdentityProvider::Revoke(std::string_view access_token) {
  std::lock_guard<std::mutex> lock(mu_);
  tokens_.erase(std::string(access_token));
}

void StaticIdentityProvider::SetUnreachable(bool unreachable) {
  std::lock_guard<std::mutex> lock(mu_);
  unreachable_ = unreachable;
}

void StaticIdentityProvider::FailNextCalls(size_t count) {
  std::lock_guard<std::mutex> lock(mu_);
  failures_remaining_ = count;
}

size_t StaticIdentityProvider::call_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return call_count_;
}

TokenClaims StaticIdentityProvider::Introspect(std::string_view access_token,
                                               std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> lock(mu_);
  ++call_count_;
  if (unreachable_ || failures_remaining_ > 0) {
    if (failures_remaining_ > 0) {
      --failures_remaining_;
    }
    throw RecoveryError(ErrorCode::kProviderUnreachable,
                        "identity provider did not answer within " +
                            std::to_string(timeout.count()) + " ms");
  }

  const auto it = tokens_.find(std::string(access_token));
  if (it == tokens_.end()) {
    throw RecoveryError(ErrorCode::kInvalidToken, "token is unknown to the provider");
  }
  return it->second;
}

}  // namespace mpcrec
