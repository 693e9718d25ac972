#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

#include "mpcrec/common/bytes.hpp"
#include "mpcrec/crypto/ec_point.hpp"
#include "mpcrec/crypto/frost.hpp"
#include "mpcrec/crypto/scalar.hpp"
#include "mpcrec/net/envelope.hpp"
#include "mpcrec/protocol/messages.hpp"
#include "mpcrec/protocol/session.hpp"

namespace mpcrec {

struct SignerSessionConfig {
  Bytes session_id;
  PartyIndex self_id = 0;
  PartyIndex coordinator_id = 0;
  uint32_t threshold = 0;
  ECPoint group_public_key;
  // x_j + tweak; wiped when the session is destroyed.
  Scalar signing_share;
  // Rebuilt locally from the verified request, never taken from the coordinator.
  Bytes message;
  std::chrono::milliseconds timeout = std::chrono::milliseconds(10000);
};

// One node's signer for one session. Fresh nonces per attempt, at most one
// partial per attempt.
class SignerSession : public Session {
 public:
  explicit SignerSession(SignerSessionConfig config,
                         std::chrono::steady_clock::time_point created_at =
                             std::chrono::steady_clock::now());
  ~SignerSession() override;

  SignerSession(const SignerSession&) = delete;
  SignerSession& operator=(const SignerSession&) = delete;

  bool HandleEnvelope(const Envelope& envelope, std::vector<Envelope>* outbox);

  PartyIndex coordinator_id() const;
  uint32_t attempt() const;
  bool HasSignedCurrentAttempt() const;
  const Bytes& message() const;

 private:
  bool HandleCommitRequest(const Envelope& envelope, std::vector<Envelope>* outbox);
  bool HandleSignPackage(const Envelope& envelope, std::vector<Envelope>* outbox);
  bool HandleCoordinatorAbort(const Envelope& envelope);

  void WipeNonces();
  Envelope MakeEnvelope(RecoveryMessageType type, Bytes payload) const;

  PartyIndex coordinator_id_ = 0;
  uint32_t threshold_ = 0;
  ECPoint group_public_key_;
  Scalar signing_share_;
  Bytes message_;

  uint32_t attempt_ = 0;
  std::optional<SigningNonces> nonces_;
  std::optional<SigningCommitment> commitment_;
  std::optional<Bytes> signed_package_;
  std::optional<Envelope> partial_reply_;
};

}  // namespace mpcrec
