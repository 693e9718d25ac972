#include "mpcrec/protocol/signing_session.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

#include "mpcrec/common/logging.hpp"
#include "mpcrec/crypto/encoding.hpp"

namespace mpcrec {
namespace {

std::string ShortId(const Bytes& session_id) {
  return ToHex(std::span<const uint8_t>(session_id).first(std::min<size_t>(session_id.size(), 8)));
}

void ValidateConfig(const SigningSessionConfig& config) {
  if (config.participants.size() < 2) {
    throw std::invalid_argument("signing session requires at least 2 participants");
  }
  if (!std::is_sorted(config.participants.begin(), config.participants.end()) ||
      std::adjacent_find(config.participants.begin(), config.participants.end()) !=
          config.participants.end()) {
    throw std::invalid_argument("participants must be sorted and unique");
  }
  if (config.participants.front() == 0) {
    throw std::invalid_argument("participants must not contain 0");
  }
  if (!std::binary_search(config.participants.begin(), config.participants.end(), config.self_id)) {
    throw std::invalid_argument("coordinator must be a participant");
  }
  if (config.threshold < 2 || config.threshold > config.participants.size()) {
    throw std::invalid_argument("threshold must satisfy 2 <= t <= n");
  }
  for (PartyIndex id : config.participants) {
    if (!config.verification_shares.contains(id)) {
      throw std::invalid_argument("missing verification share for party " + std::to_string(id));
    }
  }
  if (config.message.empty()) {
    throw std::invalid_argument("signing message must not be empty");
  }
}

}  // namespace

SigningSession::SigningSession(SigningSessionConfig config,
                               std::chrono::steady_clock::time_point created_at)
    : Session(config.session_id, config.self_id, config.timeout, created_at) {
  ValidateConfig(config);
  participants_ = std::move(config.participants);
  threshold_ = config.threshold;
  group_public_key_ = config.group_public_key;
  verification_shares_ = std::move(config.verification_shares);
  message_ = std::move(config.message);
}

std::vector<Envelope> SigningSession::Start() {
  if (attempt_ != 0) {
    throw std::logic_error("signing session already started");
  }
  std::vector<Envelope> out;
  BeginAttempt(&out);
  return out;
}

bool SigningSession::HandleEnvelope(const Envelope& envelope, std::vector<Envelope>* outbox) {
  if (outbox == nullptr) {
    throw std::invalid_argument("outbox must not be null");
  }
  if (IsTerminal() || attempt_ == 0) {
    return false;
  }

  std::string error;
  if (!ValidateSessionBinding(envelope.session_id, envelope.to, &error)) {
    Log()->debug("session {} dropped envelope: {}", ShortId(session_id()), error);
    return false;
  }
  if (!IsParticipant(envelope.from)) {
    return false;
  }

  switch (static_cast<RecoveryMessageType>(envelope.type)) {
    case RecoveryMessageType::kCommitment:
      return HandleCommitment(envelope, outbox);
    case RecoveryMessageType::kPartial:
      return HandlePartial(envelope, outbox);
    case RecoveryMessageType::kAbort:
      return HandlePeerAbort(envelope, outbox);
    default:
      return false;
  }
}

void SigningSession::HandleDeliveryFailure(PartyIndex party_id, std::vector<Envelope>* outbox) {
  if (IsTerminal() || !IsParticipant(party_id) || !IsAvailable(party_id)) {
    return;
  }
  RemoveCandidate(party_id, Removal::kDeclined, ErrorCode::kNodeUnreachable,
                  "party " + std::to_string(party_id) + " is unreachable", outbox);
}

bool SigningSession::HandleCommitment(const Envelope& envelope, std::vector<Envelope>* outbox) {
  if (!IsAvailable(envelope.from)) {
    return false;
  }

  CommitmentMessage message;
  try {
    message = DecodeCommitment(envelope.payload);
  } catch (const std::invalid_argument& ex) {
    Log()->warn("session {} malformed commitment from party {}: {}",
                ShortId(session_id()), envelope.from, ex.what());
    return false;
  }
  if (message.attempt != attempt_) {
    return false;
  }

  const SigningCommitment commitment{envelope.from, message.hiding, message.binding};
  const auto existing = commitments_.find(envelope.from);
  if (existing != commitments_.end()) {
    if (existing->second == commitment) {
      return true;
    }
    const std::string detail = "party " + std::to_string(envelope.from) +
                               " sent two different commitments in attempt " +
                               std::to_string(attempt_);
    LogSecurityEvent(ErrorCode::kConflictingPartial, "signing session " + ShortId(session_id()), detail);
    RemoveCandidate(envelope.from, Removal::kByzantine, ErrorCode::kConflictingPartial, detail, outbox);
    return false;
  }

  commitments_.emplace(envelope.from, commitment);
  MaybeSendPackage(outbox);
  return true;
}

bool SigningSession::HandlePartial(const Envelope& envelope, std::vector<Envelope>* outbox) {
  if (!IsAvailable(envelope.from)) {
    return false;
  }

  PartialMessage message;
  try {
    message = DecodePartial(envelope.payload);
  } catch (const std::invalid_argument& ex) {
    Log()->warn("session {} malformed partial from party {}: {}",
                ShortId(session_id()), envelope.from, ex.what());
    return false;
  }
  if (message.attempt != attempt_ || !package_.has_value() || !package_->Contains(envelope.from)) {
    return false;
  }

  const std::string where = "signing session " + ShortId(session_id());
  const auto existing = partials_.find(envelope.from);
  if (existing != partials_.end()) {
    if (existing->second == message.share) {
      return true;
    }
    const std::string detail = "party " + std::to_string(envelope.from) +
                               " sent two different partials in attempt " +
                               std::to_string(attempt_);
    LogSecurityEvent(ErrorCode::kConflictingPartial, where, detail);
    RemoveCandidate(envelope.from, Removal::kByzantine, ErrorCode::kConflictingPartial, detail, outbox);
    return false;
  }

  if (!VerifySignatureShare(*package_, envelope.from, verification_shares_.at(envelope.from),
                            message.share)) {
    const std::string detail = "party " + std::to_string(envelope.from) +
                               " sent a partial that does not verify in attempt " +
                               std::to_string(attempt_);
    LogSecurityEvent(ErrorCode::kInvalidSignature, where, detail);
    RemoveCandidate(envelope.from, Removal::kByzantine, ErrorCode::kInvalidSignature, detail, outbox);
    return false;
  }

  partials_.emplace(envelope.from, message.share);
  MaybeFinalize();
  return true;
}

bool SigningSession::HandlePeerAbort(const Envelope& envelope, std::vector<Envelope>* outbox) {
  if (envelope.from == self_id()) {
    return false;
  }
  if (!IsAvailable(envelope.from)) {
    return true;
  }

  AbortMessage message;
  try {
    message = DecodeAbort(envelope.payload);
  } catch (const std::invalid_argument& ex) {
    message.code = ErrorCode::kInvalidRequest;
    message.reason = std::string("malformed abort: ") + ex.what();
  }

  Log()->info("session {} party {} declined: {} ({})", ShortId(session_id()), envelope.from,
              ErrorCodeName(message.code), message.reason);
  RemoveCandidate(envelope.from, Removal::kDeclined, message.code,
                  "party " + std::to_string(envelope.from) + " declined: " + message.reason, outbox);
  return true;
}

void SigningSession::BeginAttempt(std::vector<Envelope>* outbox) {
  ++attempt_;
  commitments_.clear();
  package_.reset();
  signer_set_.clear();
  partials_.clear();

  Log()->debug("session {} attempt {} with {} available parties",
               ShortId(session_id()), attempt_, AvailableCount());
  outbox->push_back(MakeEnvelope(kBroadcastPartyId, RecoveryMessageType::kCommitRequest,
                                 EncodeCommitRequest(CommitRequestMessage{attempt_})));
}

void SigningSession::MaybeSendPackage(std::vector<Envelope>* outbox) {
  if (package_.has_value() || commitments_.size() < threshold_) {
    return;
  }

  std::vector<SigningCommitment> chosen;
  chosen.reserve(threshold_);
  for (const auto& [id, commitment] : commitments_) {
    (void)id;
    chosen.push_back(commitment);
    if (chosen.size() == threshold_) {
      break;
    }
  }

  package_.emplace(group_public_key_, chosen, message_);
  signer_set_ = package_->signers();

  const Bytes payload = EncodeSignPackage(SignPackageMessage{attempt_, chosen});
  for (PartyIndex id : signer_set_) {
    outbox->push_back(MakeEnvelope(id, RecoveryMessageType::kSignPackage, payload));
  }
}

void SigningSession::MaybeFinalize() {
  if (!package_.has_value() || partials_.size() < signer_set_.size()) {
    return;
  }

  MarkQuorumReached();
  Signature signature = AggregateSignature(*package_, partials_);
  if (!VerifySignature(group_public_key_, message_, signature)) {
    LogSecurityEvent(ErrorCode::kInvalidSignature, "signing session " + ShortId(session_id()),
                     "aggregate signature failed verification");
    Abort(ErrorCode::kInvalidSignature, "aggregate signature failed verification");
    return;
  }

  signature_ = std::move(signature);
  Finalize();
  Log()->info("session {} finalized in attempt {} with signers {}",
              ShortId(session_id()), attempt_, signer_set_.size());
}

void SigningSession::RemoveCandidate(PartyIndex party_id,
                                     Removal removal,
                                     ErrorCode code,
                                     const std::string& detail,
                                     std::vector<Envelope>* outbox) {
  if (removal == Removal::kByzantine) {
    excluded_.insert(party_id);
  } else {
    rejected_.insert(party_id);
  }
  commitments_.erase(party_id);
  partials_.erase(party_id);

  if (AvailableCount() < threshold_) {
    Abort(code, "only " + std::to_string(AvailableCount()) + " of " +
                    std::to_string(participants_.size()) +
                    " parties remain, threshold " + std::to_string(threshold_) + "; " + detail);
    return;
  }

  if (package_.has_value() && package_->Contains(party_id)) {
    BeginAttempt(outbox);
  }
}

bool SigningSession::IsParticipant(PartyIndex party_id) const {
  return std::binary_search(participants_.begin(), participants_.end(), party_id);
}

bool SigningSession::IsAvailable(PartyIndex party_id) const {
  return !excluded_.contains(party_id) && !rejected_.contains(party_id);
}

size_t SigningSession::AvailableCount() const {
  return participants_.size() - excluded_.size() - rejected_.size();
}

Envelope SigningSession::MakeEnvelope(PartyIndex to, RecoveryMessageType type, Bytes payload) const {
  Envelope out;
  out.session_id = session_id();
  out.from = self_id();
  out.to = to;
  out.type = MessageTypeValue(type);
  out.payload = std::move(payload);
  return out;
}

uint32_t SigningSession::attempt() const {
  return attempt_;
}

uint32_t SigningSession::threshold() const {
  return threshold_;
}

const Bytes& SigningSession::message() const {
  return message_;
}

const ECPoint& SigningSession::group_public_key() const {
  return group_public_key_;
}

const std::vector<PartyIndex>& SigningSession::signer_set() const {
  return signer_set_;
}

const std::set<PartyIndex>& SigningSession::excluded() const {
  return excluded_;
}

const std::set<PartyIndex>& SigningSession::rejected() const {
  return rejected_;
}

size_t SigningSession::received_partial_count() const {
  return partials_.size();
}

const Signature& SigningSession::signature() const {
  if (status() != SessionStatus::kFinalized || !signature_.has_value()) {
    throw std::logic_error("signature is only available once the session is finalized");
  }
  return *signature_;
}

}  // namespace mpcrec
