#include "mpcrec/common/errors.hpp"

namespace mpcrec {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kInvalidToken:
      return "InvalidToken";
    case ErrorCode::kProviderUnreachable:
      return "ProviderUnreachable";
    case ErrorCode::kUnauthorizedKey:
      return "UnauthorizedKey";
    case ErrorCode::kInvalidSignature:
      return "InvalidSignature";
    case ErrorCode::kReplayedRequest:
      return "ReplayedRequest";
    case ErrorCode::kAlreadyExists:
      return "AlreadyExists";
    case ErrorCode::kMethodNotFound:
      return "MethodNotFound";
    case ErrorCode::kQuorumTimeout:
      return "QuorumTimeout";
    case ErrorCode::kConflictingPartial:
      return "ConflictingPartial";
    case ErrorCode::kNodeUnreachable:
      return "NodeUnreachable";
    case ErrorCode::kInvalidRequest:
      return "InvalidRequest";
  }
  return "Unknown";
}

bool IsRetryable(ErrorCode code) {
  return code == ErrorCode::kProviderUnreachable ||
         code == ErrorCode::kNodeUnreachable ||
         code == ErrorCode::kQuorumTimeout;
}

bool IsSecurityRelevant(ErrorCode code) {
  return code == ErrorCode::kInvalidSignature ||
         code == ErrorCode::kUnauthorizedKey ||
         code == ErrorCode::kReplayedRequest ||
         code == ErrorCode::kConflictingPartial;
}

ErrorCode ErrorCodeFromWire(uint32_t value) {
  if (value < static_cast<uint32_t>(ErrorCode::kInvalidToken) ||
      value > static_cast<uint32_t>(ErrorCode::kInvalidRequest)) {
    throw std::invalid_argument("unknown error code on the wire");
  }
  return static_cast<ErrorCode>(value);
}

RecoveryError::RecoveryError(ErrorCode code, const std::string& detail)
    : std::runtime_error(std::string(ErrorCodeName(code)) + ": " + detail), code_(code) {}

ErrorCode RecoveryError::code() const {
  return code_;
}

bool RecoveryError::retryable() const {
  return IsRetryable(code_);
}

}  // namespace mpcrec
