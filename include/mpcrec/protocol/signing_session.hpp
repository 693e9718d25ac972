#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "mpcrec/common/bytes.hpp"
#include "mpcrec/crypto/ec_point.hpp"
#include "mpcrec/crypto/frost.hpp"
#include "mpcrec/net/envelope.hpp"
#include "mpcrec/protocol/messages.hpp"
#include "mpcrec/protocol/session.hpp"

namespace mpcrec {

struct SigningSessionConfig {
  Bytes session_id;
  PartyIndex self_id = 0;
  std::vector<PartyIndex> participants;
  uint32_t threshold = 0;
  // Key the final signature verifies under, and the matching per-party
  // verification shares (both already tweaked for derived keys).
  ECPoint group_public_key;
  std::map<PartyIndex, ECPoint> verification_shares;
  Bytes message;
  std::chrono::milliseconds timeout = std::chrono::milliseconds(10000);
};

// Coordinator side of a FROST signing session, run by the node that received
// the user's request. It treats its own signer like any other peer.
class SigningSession : public Session {
 public:
  explicit SigningSession(SigningSessionConfig config,
                          std::chrono::steady_clock::time_point created_at =
                              std::chrono::steady_clock::now());

  // Opens attempt 1. Returns the commit-request broadcast.
  std::vector<Envelope> Start();

  bool HandleEnvelope(const Envelope& envelope, std::vector<Envelope>* outbox);
  void HandleDeliveryFailure(PartyIndex party_id, std::vector<Envelope>* outbox);

  uint32_t attempt() const;
  uint32_t threshold() const;
  const Bytes& message() const;
  const ECPoint& group_public_key() const;
  const std::vector<PartyIndex>& signer_set() const;
  const std::set<PartyIndex>& excluded() const;
  const std::set<PartyIndex>& rejected() const;
  size_t received_partial_count() const;
  const Signature& signature() const;

 private:
  enum class Removal {
    kByzantine,
    kDeclined,
  };

  bool HandleCommitment(const Envelope& envelope, std::vector<Envelope>* outbox);
  bool HandlePartial(const Envelope& envelope, std::vector<Envelope>* outbox);
  bool HandlePeerAbort(const Envelope& envelope, std::vector<Envelope>* outbox);

  void BeginAttempt(std::vector<Envelope>* outbox);
  void MaybeSendPackage(std::vector<Envelope>* outbox);
  void MaybeFinalize();
  void RemoveCandidate(PartyIndex party_id,
                       Removal removal,
                       ErrorCode code,
                       const std::string& detail,
                       std::vector<Envelope>* outbox);

  bool IsParticipant(PartyIndex party_id) const;
  bool IsAvailable(PartyIndex party_id) const;
  size_t AvailableCount() const;
  Envelope MakeEnvelope(PartyIndex to, RecoveryMessageType type, Bytes payload) const;

  std::vector<PartyIndex> participants_;
  uint32_t threshold_ = 0;
  ECPoint group_public_key_;
  std::map<PartyIndex, ECPoint> verification_shares_;
  Bytes message_;

  uint32_t attempt_ = 0;
  std::map<PartyIndex, SigningCommitment> commitments_;
  std::optional<SigningPackage> package_;
  std::vector<PartyIndex> signer_set_;
  std::map<PartyIndex, Scalar> partials_;

  std::set<PartyIndex> excluded_;
  std::set<PartyIndex> rejected_;
  std::optional<Signature> signature_;
};

}  // namespace mpcrec
