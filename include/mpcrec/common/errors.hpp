#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace mpcrec {

enum class ErrorCode : uint32_t {
  kInvalidToken = 1,
  kProviderUnreachable = 2,
  kUnauthorizedKey = 3,
  kInvalidSignature = 4,
  kReplayedRequest = 5,
  kAlreadyExists = 6,
  kMethodNotFound = 7,
  kQuorumTimeout = 8,
  kConflictingPartial = 9,
  kNodeUnreachable = 10,
  kInvalidRequest = 11,
};

const char* ErrorCodeName(ErrorCode code);

// Provider/peer transport failures and quorum timeouts; the caller may retry.
bool IsRetryable(ErrorCode code);

// Failures that may indicate an attack and must never be downgraded.
bool IsSecurityRelevant(ErrorCode code);

ErrorCode ErrorCodeFromWire(uint32_t value);

class RecoveryError : public std::runtime_error {
 public:
  RecoveryError(ErrorCode code, const std::string& detail);

  ErrorCode code() const;
  bool retryable() const;

 private:
  ErrorCode code_;
};

}  // namespace mpcrec
