#include "mpcrec/verify/ownership_verifier.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "mpcrec/common/errors.hpp"
#include "mpcrec/common/logging.hpp"
#include "mpcrec/crypto/ecdsa.hpp"

namespace mpcrec {
namespace {

[[noreturn]] void Reject(ErrorCode code, std::string_view account_id, const std::string& detail) {
  LogSecurityEvent(code, "ownership verifier", std::string(account_id) + ": " + detail);
  throw RecoveryError(code, detail);
}

}  // namespace

OwnershipVerifier::OwnershipVerifier(OwnershipVerifierConfig config,
                                     std::shared_ptr<IChainKeySource> chain,
                                     WallClock clock,
                                     Sleeper sleeper)
    : config_(std::move(config)),
      chain_(std::move(chain)),
      clock_(std::move(clock)),
      sleeper_(std::move(sleeper)),
      replay_guard_(config_.freshness_window + config_.max_clock_skew) {
  if (!chain_) {
    throw std::invalid_argument("chain key source must not be null");
  }
  if (!clock_ || !sleeper_) {
    throw std::invalid_argument("ownership verifier clock and sleeper must be set");
  }
  if (config_.freshness_window.count() <= 0 || config_.max_clock_skew.count() < 0 ||
      config_.call_timeout.count() <= 0) {
    throw std::invalid_argument("ownership verifier timing parameters are invalid");
  }
  ValidateRetryPolicy(config_.retry);
}

void OwnershipVerifier::Verify(std::string_view account_id,
                               std::string_view access_token,
                               const BindingProof& proof) {
  if (account_id.empty() || account_id.size() > kMaxAccountIdLen) {
    throw RecoveryError(ErrorCode::kInvalidRequest, "account_id must be 1..256 bytes");
  }
  if (proof.nonce.size() < kMinBindingNonceLen || proof.nonce.size() > kMaxBindingNonceLen) {
    throw RecoveryError(ErrorCode::kInvalidRequest, "binding nonce must be 16..64 bytes");
  }

  const uint64_t now = ToUnixSeconds(clock_());
  const uint64_t window = static_cast<uint64_t>(config_.freshness_window.count());
  const uint64_t skew = static_cast<uint64_t>(config_.max_clock_skew.count());
  if (proof.timestamp + window < now || proof.timestamp > now + skew) {
    Reject(ErrorCode::kReplayedRequest, account_id, "binding timestamp is outside the freshness window");
  }
  if (replay_guard_.Contains(account_id, proof.nonce)) {
    Reject(ErrorCode::kReplayedRequest, account_id, "binding nonce was already used");
  }

  const Bytes digest = BindingMessageDigest(account_id, access_token, proof.nonce, proof.timestamp);
  if (!VerifyEcdsaCompact(proof.signer_public_key, digest, proof.signature)) {
    Reject(ErrorCode::kInvalidSignature, account_id, "binding signature does not verify");
  }

  const std::vector<ECPoint> keys = RetryWithBackoff(
      config_.retry, "authorized key fetch",
      [&]() { return chain_->FetchAuthorizedKeys(account_id, config_.call_timeout); }, sleeper_);
  if (std::find(keys.begin(), keys.end(), proof.signer_public_key) == keys.end()) {
    Reject(ErrorCode::kUnauthorizedKey, account_id,
           "key " + proof.signer_public_key.ToHex() + " is not authorized on the account");
  }

  if (!replay_guard_.TryRecord(account_id, proof.nonce, proof.timestamp, now)) {
    Reject(ErrorCode::kReplayedRequest, account_id, "binding nonce was already used");
  }
}

const ReplayGuard& OwnershipVerifier::replay_guard() const {
  return replay_guard_;
}

}  // namespace mpcrec
