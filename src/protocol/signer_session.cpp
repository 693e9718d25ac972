#include "mpcrec/protocol/signer_session.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "mpcrec/common/logging.hpp"
#include "mpcrec/common/secure_zeroize.hpp"

namespace mpcrec {

SignerSession::SignerSession(SignerSessionConfig config,
                             std::chrono::steady_clock::time_point created_at)
    : Session(config.session_id, config.self_id, config.timeout, created_at),
      coordinator_id_(config.coordinator_id),
      threshold_(config.threshold),
      group_public_key_(config.group_public_key),
      signing_share_(config.signing_share),
      message_(std::move(config.message)) {
  SecureZeroize(&config.signing_share);
  if (coordinator_id_ == 0) {
    throw std::invalid_argument("coordinator_id must be non-zero");
  }
  if (threshold_ < 2) {
    throw std::invalid_argument("threshold must be >= 2");
  }
  if (signing_share_.IsZero()) {
    throw std::invalid_argument("signing share must be non-zero");
  }
  if (message_.empty()) {
    throw std::invalid_argument("signing message must not be empty");
  }
}

SignerSession::~SignerSession() {
  WipeNonces();
  SecureZeroize(&signing_share_);
}

bool SignerSession::HandleEnvelope(const Envelope& envelope, std::vector<Envelope>* outbox) {
  if (outbox == nullptr) {
    throw std::invalid_argument("outbox must not be null");
  }
  if (IsTerminal()) {
    return false;
  }

  std::string error;
  if (!ValidateSessionBinding(envelope.session_id, envelope.to, &error)) {
    return false;
  }
  if (envelope.from != coordinator_id_) {
    return false;
  }

  switch (static_cast<RecoveryMessageType>(envelope.type)) {
    case RecoveryMessageType::kCommitRequest:
      return HandleCommitRequest(envelope, outbox);
    case RecoveryMessageType::kSignPackage:
      return HandleSignPackage(envelope, outbox);
    case RecoveryMessageType::kAbort:
      return HandleCoordinatorAbort(envelope);
    default:
      return false;
  }
}

bool SignerSession::HandleCommitRequest(const Envelope& envelope, std::vector<Envelope>* outbox) {
  CommitRequestMessage request;
  try {
    request = DecodeCommitRequest(envelope.payload);
  } catch (const std::invalid_argument&) {
    return false;
  }

  if (request.attempt == 0 || request.attempt < attempt_) {
    return false;
  }
  if (request.attempt == attempt_) {
    if (!commitment_.has_value()) {
      return false;
    }
    outbox->push_back(MakeEnvelope(
        RecoveryMessageType::kCommitment,
        EncodeCommitment(CommitmentMessage{attempt_, commitment_->hiding, commitment_->binding})));
    return true;
  }

  WipeNonces();
  signed_package_.reset();
  partial_reply_.reset();

  attempt_ = request.attempt;
  nonces_ = GenerateNonces(signing_share_);
  commitment_ = CommitToNonces(self_id(), *nonces_);
  outbox->push_back(MakeEnvelope(
      RecoveryMessageType::kCommitment,
      EncodeCommitment(CommitmentMessage{attempt_, commitment_->hiding, commitment_->binding})));
  return true;
}

bool SignerSession::HandleSignPackage(const Envelope& envelope, std::vector<Envelope>* outbox) {
  if (signed_package_.has_value()) {
    if (envelope.payload == *signed_package_) {
      outbox->push_back(*partial_reply_);
      return true;
    }
    // Ignore a stale package for an earlier attempt; a different package for
    // the attempt already signed is equivocation by the coordinator.
    try {
      if (DecodeSignPackage(envelope.payload).attempt != attempt_) {
        return false;
      }
    } catch (const std::invalid_argument&) {
      return false;
    }
    LogSecurityEvent(ErrorCode::kConflictingPartial, "signer " + std::to_string(self_id()),
                     "coordinator " + std::to_string(coordinator_id_) +
                         " sent a second package for attempt " + std::to_string(attempt_));
    return false;
  }

  SignPackageMessage message;
  try {
    message = DecodeSignPackage(envelope.payload);
  } catch (const std::invalid_argument& ex) {
    Log()->warn("signer {} malformed sign package: {}", self_id(), ex.what());
    return false;
  }
  if (message.attempt != attempt_ || !nonces_.has_value() || !commitment_.has_value()) {
    return false;
  }
  if (message.commitments.size() < threshold_) {
    LogSecurityEvent(ErrorCode::kInvalidRequest, "signer " + std::to_string(self_id()),
                     "sign package below threshold");
    return false;
  }

  std::optional<SigningPackage> package;
  try {
    package.emplace(group_public_key_, message.commitments, message_);
  } catch (const std::invalid_argument& ex) {
    Log()->warn("signer {} rejected sign package: {}", self_id(), ex.what());
    return false;
  }
  if (!package->Contains(self_id()) || package->CommitmentFor(self_id()) != *commitment_) {
    LogSecurityEvent(ErrorCode::kInvalidRequest, "signer " + std::to_string(self_id()),
                     "sign package does not carry this signer's commitment");
    return false;
  }

  const Scalar share = SignShare(*package, self_id(), signing_share_, *nonces_);
  WipeNonces();

  signed_package_ = envelope.payload;
  partial_reply_ = MakeEnvelope(RecoveryMessageType::kPartial,
                                EncodePartial(PartialMessage{attempt_, share}));
  outbox->push_back(*partial_reply_);
  return true;
}

bool SignerSession::HandleCoordinatorAbort(const Envelope& envelope) {
  AbortMessage message;
  try {
    message = DecodeAbort(envelope.payload);
  } catch (const std::invalid_argument& ex) {
    message.code = ErrorCode::kInvalidRequest;
    message.reason = ex.what();
  }
  WipeNonces();
  Abort(message.code, "coordinator aborted: " + message.reason);
  return true;
}

void SignerSession::WipeNonces() {
  if (nonces_.has_value()) {
    SecureZeroize(&nonces_->hiding);
    SecureZeroize(&nonces_->binding);
    nonces_.reset();
  }
}

Envelope SignerSession::MakeEnvelope(RecoveryMessageType type, Bytes payload) const {
  Envelope out;
  out.session_id = session_id();
  out.from = self_id();
  out.to = coordinator_id_;
  out.type = MessageTypeValue(type);
  out.payload = std::move(payload);
  return out;
}

PartyIndex SignerSession::coordinator_id() const {
  return coordinator_id_;
}

uint32_t SignerSession::attempt() const {
  return attempt_;
}

bool SignerSession::HasSignedCurrentAttempt() const {
  return signed_package_.has_value();
}

const Bytes& SignerSession::message() const {
  return message_;
}

}  // namespace mpcrec
