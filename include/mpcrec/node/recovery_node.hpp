#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "mpcrec/common/clock.hpp"
#include "mpcrec/common/retry.hpp"
#include "mpcrec/common/thread_pool.hpp"
#include "mpcrec/crypto/frost.hpp"
#include "mpcrec/derivation/key_derivation.hpp"
#include "mpcrec/derivation/key_set.hpp"
#include "mpcrec/net/transport.hpp"
#include "mpcrec/node/node_config.hpp"
#include "mpcrec/protocol/messages.hpp"
#include "mpcrec/protocol/session_router.hpp"
#include "mpcrec/protocol/signer_session.hpp"
#include "mpcrec/protocol/signing_session.hpp"
#include "mpcrec/registry/recovery_key_resolver.hpp"
#include "mpcrec/registry/recovery_method_registry.hpp"
#include "mpcrec/verify/chain.hpp"
#include "mpcrec/verify/identity_verifier.hpp"
#include "mpcrec/verify/ownership_verifier.hpp"

namespace mpcrec {

struct NodeDependencies {
  std::shared_ptr<ITransport> transport;
  std::shared_ptr<IIdentityProvider> identity_provider;
  std::shared_ptr<IChainKeySource> chain;
  // Optional. Without it RecoverAccount returns the signature to the caller.
  std::shared_ptr<IChainSubmitter> submitter;
  // Optional. Defaults to SQLite at NodeConfig::registry_path.
  std::shared_ptr<IRecoveryMethodStore> store;
  // Optional. Defaults to ShamirAdditiveDerivation.
  std::shared_ptr<const IKeyDerivationScheme> derivation;
  WallClock clock;
  Sleeper sleeper;
};

struct AddRecoveryMethodRequest {
  std::string access_token;
  std::string account_id;
  BindingProof proof;
};

struct AddRecoveryMethodResult {
  ECPoint recovery_public_key;
  bool newly_registered = false;
  // Network attestation over attested_payload; present for net-new
  // registrations only.
  std::optional<Signature> attestation;
  Bytes attested_payload;
};

struct RecoverAccountRequest {
  std::string access_token;
  std::string account_id;
  ECPoint new_public_key;
};

enum class RecoveryStatus {
  kSigned,
  kSubmitted,
};

struct RecoverAccountResult {
  RecoveryStatus status = RecoveryStatus::kSigned;
  ECPoint recovery_public_key;
  Signature signature;
  Bytes payload;
};

// One participant of the recovery network. Every node runs the same code and
// can act as the initiator for a user request; peers re-verify every claim
// locally before contributing to a signature.
class RecoveryNode {
 public:
  RecoveryNode(NodeConfig config, NodeSecretShare share, NodeDependencies deps);
  ~RecoveryNode();

  RecoveryNode(const RecoveryNode&) = delete;
  RecoveryNode& operator=(const RecoveryNode&) = delete;

  // Starts accepting envelopes from the transport.
  void Start();
  // Stops ingestion and drains queued work. Idempotent.
  void Shutdown();

  AddRecoveryMethodResult AddRecoveryMethod(const AddRecoveryMethodRequest& request);
  RecoverAccountResult RecoverAccount(const RecoverAccountRequest& request);

  std::optional<RecoveryMethod> LookupRecoveryMethod(std::string_view account_id,
                                                     const Identity& identity) const;
  bool RevokeRecoveryMethod(std::string_view account_id, const Identity& identity);

  // This node's partial recovery public key for (account, identity).
  ECPoint DerivePartialPublicKey(std::string_view account_id, const Identity& identity) const;
  // Recovery key as derived from public data, ignoring the registry.
  ECPoint DeriveRecoveryPublicKey(std::string_view account_id, const Identity& identity) const;

  PartyIndex self_id() const;
  size_t active_session_count() const;
  size_t rejected_envelope_count() const;

 private:
  struct SignContext {
    RequestKind kind = RequestKind::kAddRecoveryMethod;
    std::string account_id;
    Identity identity;
    ECPoint recovery_key;
    ECPoint signing_key;
    Scalar tweak;
    Bytes message;
  };

  struct SessionEntry {
    SignContext context;
    std::unique_ptr<SigningSession> coordinator;
    std::unique_ptr<SignerSession> signer;
  };

  // Lets the transport callback outlive the node safely.
  struct IngressGate {
    std::mutex mu;
    RecoveryNode* node = nullptr;
  };

  void OnEnvelope(const Envelope& envelope);
  void ProcessEnvelope(const Envelope& envelope);
  void ProcessSignRequest(const Envelope& envelope);
  void Decline(const Envelope& request, ErrorCode code, const std::string& reason);

  SignContext VerifyPeerRequest(const SigningRequest& request, const Bytes& session_id);
  SignContext AddMethodContext(std::string_view account_id,
                               const Identity& identity,
                               const ECPoint& recovery_key,
                               const Bytes& session_id) const;
  SignContext RecoverContext(std::string_view account_id,
                             const Identity& identity,
                             const ECPoint& new_public_key,
                             const Bytes& session_id) const;

  std::unique_ptr<SignerSession> MakeSigner(const Bytes& session_id,
                                            PartyIndex coordinator_id,
                                            const SignContext& context) const;
  std::unique_ptr<SigningSession> MakeCoordinator(const Bytes& session_id,
                                                  const SignContext& context) const;

  Signature RunSigningSession(const SigningRequest& request,
                              const Bytes& session_id,
                              const SignContext& context);

  bool RouteToEntry(SessionEntry* entry, const Envelope& envelope, std::vector<Envelope>* outbox);
  void Dispatch(std::vector<Envelope> outbox);
  void PostLocal(Envelope envelope);
  void EraseSessionLocked(const std::string& key);
  void SweepExpiredLocked(std::chrono::steady_clock::time_point now);
  Envelope MakeEnvelope(const Bytes& session_id,
                        PartyIndex to,
                        RecoveryMessageType type,
                        Bytes payload) const;

  NodeConfig config_;
  NodeSecretShare share_;
  std::vector<PartyIndex> participants_;

  std::shared_ptr<ITransport> transport_;
  std::shared_ptr<IChainSubmitter> submitter_;
  std::shared_ptr<const IKeyDerivationScheme> derivation_;
  WallClock clock_;
  Sleeper sleeper_;

  IdentityVerifier identity_verifier_;
  OwnershipVerifier ownership_verifier_;
  RecoveryMethodRegistry registry_;
  RecoveryKeyResolver resolver_;

  std::shared_ptr<IngressGate> gate_;
  std::atomic<bool> stopping_{false};

  mutable std::mutex mu_;
  std::condition_variable cv_;
  SessionRouter router_;
  std::unordered_map<std::string, std::unique_ptr<SessionEntry>> sessions_;
  // Sign requests still being verified; envelopes that race ahead wait here.
  std::unordered_map<std::string, std::vector<Envelope>> pending_;
  // Closed sessions; a replayed request for one of them is ignored.
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> finished_;

  // Declared last: workers are joined before anything they touch goes away.
  ThreadPool pool_;
};

}  // namespace mpcrec
