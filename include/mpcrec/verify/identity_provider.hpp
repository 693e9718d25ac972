#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace mpcrec {

struct TokenClaims {
  std::string issuer;
  std::string subject;
  std::string audience;
  uint64_t issued_at = 0;   // unix seconds
  uint64_t expires_at = 0;  // unix seconds
};

// Introspection endpoint of an OAuth provider. Throws RecoveryError with
// kInvalidToken for a rejected token and kProviderUnreachable when the
// provider cannot answer within the timeout.
class IIdentityProvider {
 public:
  virtual ~IIdentityProvider() = default;

  virtual TokenClaims Introspect(std::string_view access_token,
                                 std::chrono::milliseconds timeout) = 0;
};

// In-process provider backed by a table of issued tokens.
class StaticIdentityProvider final : public IIdentityProvider {
 public:
  void Issue(std::string access_token, TokenClaims claims);
  void Revoke(std::string_view access_token);

  void SetUnreachable(bool unreachable);
  // The next `count` calls fail as unreachable, then service resumes.
  void FailNextCalls(size_t count);
  size_t call_count() const;

  TokenClaims Introspect(std::string_view access_token,
                         std::chrono::milliseconds timeout) override;

 private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, TokenClaims> tokens_;
  bool unreachable_ = false;
  size_t failures_remaining_ = 0;
  size_t call_count_ = 0;
};

}  // namespace mpcrec
