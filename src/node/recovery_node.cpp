#include "mpcrec/node/recovery_node.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "mpcrec/common/errors.hpp"
#include "mpcrec/common/logging.hpp"
#include "mpcrec/crypto/ecdsa.hpp"
#include "mpcrec/crypto/encoding.hpp"
#include "mpcrec/crypto/random.hpp"

namespace mpcrec {
namespace {

constexpr size_t kSessionIdLen = 32;

// Checked before any verifier runs so a malformed request never spends a nonce.
void ValidateAccountId(const std::string& account_id) {
  if (account_id.empty() || account_id.size() > kMaxAccountIdLen) {
    throw RecoveryError(ErrorCode::kInvalidRequest, "account_id must be 1..256 bytes");
  }
}

NodeConfig Validated(NodeConfig config) {
  ValidateNodeConfig(config);
  return config;
}

IdentityVerifierConfig IdentityConfigFrom(const NodeConfig& config) {
  IdentityVerifierConfig out;
  out.trusted_providers = config.trusted_providers;
  out.audience = config.audience;
  out.max_clock_skew = config.max_clock_skew;
  out.retry = config.retry;
  out.call_timeout = config.provider_call_timeout;
  return out;
}

OwnershipVerifierConfig OwnershipConfigFrom(const NodeConfig& config) {
  OwnershipVerifierConfig out;
  out.freshness_window = config.freshness_window;
  out.max_clock_skew = config.max_clock_skew;
  out.retry = config.retry;
  out.call_timeout = config.provider_call_timeout;
  return out;
}

template <typename T>
std::shared_ptr<T> Required(std::shared_ptr<T> ptr, const char* name) {
  if (!ptr) {
    throw std::invalid_argument(std::string("node dependency '") + name + "' must be set");
  }
  return ptr;
}

std::shared_ptr<IRecoveryMethodStore> StoreOrDefault(std::shared_ptr<IRecoveryMethodStore> store,
                                                     const std::string& path) {
  if (store) {
    return store;
  }
  return std::make_shared<SqliteRecoveryMethodStore>(path);
}

std::string ShortId(const Bytes& session_id) {
  return ToHex(std::span<const uint8_t>(session_id).first(std::min<size_t>(session_id.size(), 8)));
}

}  // namespace

RecoveryNode::RecoveryNode(NodeConfig config, NodeSecretShare share, NodeDependencies deps)
    : config_(Validated(std::move(config))),
      share_(share),
      participants_(config_.key_set.participants()),
      transport_(Required(std::move(deps.transport), "transport")),
      submitter_(std::move(deps.submitter)),
      derivation_(deps.derivation ? std::move(deps.derivation) : DefaultKeyDerivationScheme()),
      clock_(deps.clock ? std::move(deps.clock) : SystemWallClock()),
      sleeper_(deps.sleeper ? std::move(deps.sleeper) : ThreadSleeper()),
      identity_verifier_(IdentityConfigFrom(config_),
                         Required(std::move(deps.identity_provider), "identity_provider"),
                         clock_, sleeper_),
      ownership_verifier_(OwnershipConfigFrom(config_), Required(std::move(deps.chain), "chain"),
                          clock_, sleeper_),
      registry_(StoreOrDefault(std::move(deps.store), config_.registry_path), clock_),
      resolver_(&registry_, derivation_, &config_.key_set),
      gate_(std::make_shared<IngressGate>()),
      router_(config_.self_id),
      pool_(config_.worker_count) {
  if (share_.party_id != config_.self_id) {
    throw std::invalid_argument("secret share belongs to another party");
  }
  ValidateSecretShare(config_.key_set, share_);
}

RecoveryNode::~RecoveryNode() {
  Shutdown();
}

void RecoveryNode::Start() {
  {
    std::lock_guard<std::mutex> lock(gate_->mu);
    if (stopping_) {
      throw std::logic_error("node has been shut down");
    }
    gate_->node = this;
  }

  std::weak_ptr<IngressGate> weak_gate = gate_;
  transport_->RegisterHandler([weak_gate](const Envelope& envelope) {
    const auto gate = weak_gate.lock();
    if (!gate) {
      return;
    }
    std::lock_guard<std::mutex> lock(gate->mu);
    if (gate->node != nullptr) {
      gate->node->OnEnvelope(envelope);
    }
  });
  Log()->info("node {} started ({} of {} parties required)", config_.self_id,
              config_.key_set.threshold, participants_.size());
}

void RecoveryNode::Shutdown() {
  if (stopping_.exchange(true)) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(gate_->mu);
    gate_->node = nullptr;
  }
  pool_.Shutdown();
  {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<std::string> signer_only;
    for (const auto& [key, entry] : sessions_) {
      if (!entry->coordinator) {
        signer_only.push_back(key);
      }
    }
    for (const std::string& key : signer_only) {
      EraseSessionLocked(key);
    }
    pending_.clear();
  }
  cv_.notify_all();
}

AddRecoveryMethodResult RecoveryNode::AddRecoveryMethod(const AddRecoveryMethodRequest& request) {
  ValidateAccountId(request.account_id);
  if (request.proof.signature.size() != kEcdsaCompactSignatureLen) {
    throw RecoveryError(ErrorCode::kInvalidSignature, "binding signature must be 64 bytes");
  }

  const Identity identity = identity_verifier_.Verify(request.access_token);
  ownership_verifier_.Verify(request.account_id, request.access_token, request.proof);

  const ResolvedRecoveryKey resolved = resolver_.Resolve(request.account_id, identity);
  AddRecoveryMethodResult result;
  result.recovery_public_key = resolved.public_key;
  if (resolved.stored) {
    Log()->info("node {}: recovery method for {} / {} already registered",
                config_.self_id, request.account_id, identity.ToString());
    return result;
  }

  const Bytes session_id = Csprng::RandomBytes(kSessionIdLen);
  const SignContext context =
      AddMethodContext(request.account_id, identity, resolved.public_key, session_id);

  SigningRequest signing_request;
  signing_request.kind = RequestKind::kAddRecoveryMethod;
  signing_request.account_id = request.account_id;
  signing_request.access_token = request.access_token;
  signing_request.proof = request.proof;

  result.attestation = RunSigningSession(signing_request, session_id, context);
  result.attested_payload = context.message;
  result.newly_registered =
      registry_.Register(request.account_id, identity, resolved.public_key) == RegisterOutcome::kCreated;
  return result;
}

RecoverAccountResult RecoveryNode::RecoverAccount(const RecoverAccountRequest& request) {
  ValidateAccountId(request.account_id);

  const Identity identity = identity_verifier_.Verify(request.access_token);
  const Bytes session_id = Csprng::RandomBytes(kSessionIdLen);
  const SignContext context =
      RecoverContext(request.account_id, identity, request.new_public_key, session_id);

  SigningRequest signing_request;
  signing_request.kind = RequestKind::kRecoverAccount;
  signing_request.account_id = request.account_id;
  signing_request.access_token = request.access_token;
  signing_request.new_public_key = request.new_public_key;

  RecoverAccountResult result;
  result.recovery_public_key = context.recovery_key;
  result.signature = RunSigningSession(signing_request, session_id, context);
  result.payload = context.message;

  if (submitter_) {
    RetryWithBackoff(
        config_.retry, "key addition submit",
        [&]() { submitter_->SubmitKeyAddition(result.payload, result.signature, context.signing_key); },
        sleeper_);
    result.status = RecoveryStatus::kSubmitted;
  }
  return result;
}

std::optional<RecoveryMethod> RecoveryNode::LookupRecoveryMethod(std::string_view account_id,
                                                                 const Identity& identity) const {
  return registry_.Lookup(account_id, identity);
}

bool RecoveryNode::RevokeRecoveryMethod(std::string_view account_id, const Identity& identity) {
  return registry_.Revoke(account_id, identity);
}

ECPoint RecoveryNode::DerivePartialPublicKey(std::string_view account_id,
                                             const Identity& identity) const {
  return derivation_->DeriveShare(share_, account_id, identity);
}

ECPoint RecoveryNode::DeriveRecoveryPublicKey(std::string_view account_id,
                                              const Identity& identity) const {
  return derivation_->DerivePublicKey(config_.key_set, account_id, identity);
}

PartyIndex RecoveryNode::self_id() const {
  return config_.self_id;
}

size_t RecoveryNode::active_session_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return sessions_.size();
}

size_t RecoveryNode::rejected_envelope_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return router_.rejected_count();
}

void RecoveryNode::OnEnvelope(const Envelope& envelope) {
  if (stopping_) {
    return;
  }

  if (envelope.type == MessageTypeValue(RecoveryMessageType::kSignRequest)) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      const std::string key = SessionRouter::SessionKey(envelope.session_id);
      if (sessions_.contains(key) || pending_.contains(key) || finished_.contains(key)) {
        Log()->debug("node {} ignoring duplicate sign request {}", config_.self_id,
                     ShortId(envelope.session_id));
        return;
      }
      pending_.emplace(key, std::vector<Envelope>{});
    }
    pool_.Post([this, envelope]() { ProcessSignRequest(envelope); });
    return;
  }

  PostLocal(envelope);
}

void RecoveryNode::ProcessEnvelope(const Envelope& envelope) {
  if (stopping_) {
    return;
  }

  std::vector<Envelope> outbox;
  {
    std::lock_guard<std::mutex> lock(mu_);
    const std::string key = SessionRouter::SessionKey(envelope.session_id);
    if (const auto it = pending_.find(key); it != pending_.end()) {
      it->second.push_back(envelope);
      return;
    }
    if (!router_.Route(envelope, &outbox)) {
      Log()->debug("node {} dropped {} from party {} for session {}", config_.self_id,
                   MessageTypeName(envelope.type), envelope.from, ShortId(envelope.session_id));
    }
    if (const auto it = sessions_.find(key); it != sessions_.end() && it->second->coordinator &&
                                             it->second->coordinator->IsTerminal()) {
      cv_.notify_all();
    }
  }
  Dispatch(std::move(outbox));
}

void RecoveryNode::ProcessSignRequest(const Envelope& envelope) {
  if (stopping_) {
    return;
  }
  const std::string key = SessionRouter::SessionKey(envelope.session_id);

  std::unique_ptr<SessionEntry> entry;
  try {
    if (envelope.from == config_.self_id || !config_.key_set.Contains(envelope.from)) {
      throw RecoveryError(ErrorCode::kInvalidRequest, "sign request from an unknown initiator");
    }
    const SigningRequest request = DecodeSigningRequest(envelope.payload);

    entry = std::make_unique<SessionEntry>();
    entry->context = VerifyPeerRequest(request, envelope.session_id);
    entry->signer = MakeSigner(envelope.session_id, envelope.from, entry->context);
    // Written regardless of how the session ends; the key is deterministic.
    if (request.kind == RequestKind::kAddRecoveryMethod) {
      registry_.Register(entry->context.account_id, entry->context.identity,
                         entry->context.recovery_key);
    }
  } catch (const RecoveryError& ex) {
    Decline(envelope, ex.code(), ex.what());
    return;
  } catch (const std::invalid_argument& ex) {
    Decline(envelope, ErrorCode::kInvalidRequest, ex.what());
    return;
  } catch (const std::runtime_error& ex) {
    Log()->error("node {} cannot serve session {}: {}", config_.self_id,
                 ShortId(envelope.session_id), ex.what());
    Decline(envelope, ErrorCode::kNodeUnreachable, "node failed internally");
    return;
  }

  std::vector<Envelope> buffered;
  {
    std::lock_guard<std::mutex> lock(mu_);
    SweepExpiredLocked(std::chrono::steady_clock::now());
    if (const auto it = pending_.find(key); it != pending_.end()) {
      buffered = std::move(it->second);
      pending_.erase(it);
    }
    SessionEntry* raw = entry.get();
    sessions_.emplace(key, std::move(entry));
    router_.RegisterSession(envelope.session_id,
                            [this, raw](const Envelope& in, std::vector<Envelope>* outbox) {
                              return RouteToEntry(raw, in, outbox);
                            });
  }
  Log()->debug("node {} joined session {} from party {}", config_.self_id,
               ShortId(envelope.session_id), envelope.from);

  for (const Envelope& early : buffered) {
    ProcessEnvelope(early);
  }
}

void RecoveryNode::Decline(const Envelope& request, ErrorCode code, const std::string& reason) {
  Log()->info("node {} declined session {} from party {}: {}", config_.self_id,
              ShortId(request.session_id), request.from, reason);
  {
    std::lock_guard<std::mutex> lock(mu_);
    const std::string key = SessionRouter::SessionKey(request.session_id);
    pending_.erase(key);
    finished_[key] = std::chrono::steady_clock::now();
  }
  if (request.from == config_.self_id || request.from == kBroadcastPartyId) {
    return;
  }
  Dispatch({MakeEnvelope(request.session_id, request.from, RecoveryMessageType::kAbort,
                         EncodeAbort(AbortMessage{code, reason}))});
}

RecoveryNode::SignContext RecoveryNode::VerifyPeerRequest(const SigningRequest& request,
                                                          const Bytes& session_id) {
  const Identity identity = identity_verifier_.Verify(request.access_token);
  switch (request.kind) {
    case RequestKind::kAddRecoveryMethod: {
      // The replay guard is per node, so every peer checks the proof itself.
      ownership_verifier_.Verify(request.account_id, request.access_token, *request.proof);
      const ResolvedRecoveryKey resolved = resolver_.Resolve(request.account_id, identity);
      return AddMethodContext(request.account_id, identity, resolved.public_key, session_id);
    }
    case RequestKind::kRecoverAccount:
      return RecoverContext(request.account_id, identity, *request.new_public_key, session_id);
  }
  throw RecoveryError(ErrorCode::kInvalidRequest, "unknown request kind");
}

RecoveryNode::SignContext RecoveryNode::AddMethodContext(std::string_view account_id,
                                                         const Identity& identity,
                                                         const ECPoint& recovery_key,
                                                         const Bytes& session_id) const {
  SignContext out;
  out.kind = RequestKind::kAddRecoveryMethod;
  out.account_id = std::string(account_id);
  out.identity = identity;
  out.recovery_key = recovery_key;
  out.signing_key = config_.key_set.group_public_key;
  out.message = BuildKeyAdditionMessage(out.kind, account_id, recovery_key, session_id);
  return out;
}

RecoveryNode::SignContext RecoveryNode::RecoverContext(std::string_view account_id,
                                                       const Identity& identity,
                                                       const ECPoint& new_public_key,
                                                       const Bytes& session_id) const {
  const std::optional<RecoveryMethod> stored = registry_.Lookup(account_id, identity);
  if (!stored.has_value()) {
    throw RecoveryError(ErrorCode::kMethodNotFound,
                        "no recovery method for " + std::string(account_id) + " / " + identity.ToString());
  }

  SignContext out;
  out.kind = RequestKind::kRecoverAccount;
  out.account_id = std::string(account_id);
  out.identity = identity;
  out.tweak = derivation_->Tweak(account_id, identity);
  out.signing_key = config_.key_set.group_public_key.AddGeneratorMultiple(out.tweak);
  if (out.signing_key != stored->public_key) {
    throw RecoveryError(ErrorCode::kInvalidRequest,
                        "stored recovery key is not reachable from the current key set");
  }
  out.recovery_key = stored->public_key;
  out.message = BuildKeyAdditionMessage(out.kind, account_id, new_public_key, session_id);
  return out;
}

std::unique_ptr<SignerSession> RecoveryNode::MakeSigner(const Bytes& session_id,
                                                        PartyIndex coordinator_id,
                                                        const SignContext& context) const {
  SignerSessionConfig config;
  config.session_id = session_id;
  config.self_id = config_.self_id;
  config.coordinator_id = coordinator_id;
  config.threshold = config_.key_set.threshold;
  config.group_public_key = context.signing_key;
  config.signing_share = share_.share + context.tweak;
  config.message = context.message;
  config.timeout = config_.session_timeout;
  return std::make_unique<SignerSession>(std::move(config));
}

std::unique_ptr<SigningSession> RecoveryNode::MakeCoordinator(const Bytes& session_id,
                                                              const SignContext& context) const {
  SigningSessionConfig config;
  config.session_id = session_id;
  config.self_id = config_.self_id;
  config.participants = participants_;
  config.threshold = config_.key_set.threshold;
  config.group_public_key = context.signing_key;
  for (const auto& [id, share] : config_.key_set.verification_shares) {
    config.verification_shares.emplace(id, share.AddGeneratorMultiple(context.tweak));
  }
  config.message = context.message;
  config.timeout = config_.session_timeout;
  return std::make_unique<SigningSession>(std::move(config));
}

Signature RecoveryNode::RunSigningSession(const SigningRequest& request,
                                          const Bytes& session_id,
                                          const SignContext& context) {
  if (stopping_) {
    throw RecoveryError(ErrorCode::kNodeUnreachable, "node is shutting down");
  }

  auto entry = std::make_unique<SessionEntry>();
  entry->context = context;
  entry->coordinator = MakeCoordinator(session_id, context);
  entry->signer = MakeSigner(session_id, config_.self_id, context);
  SigningSession* coordinator = entry->coordinator.get();
  const std::string key = SessionRouter::SessionKey(session_id);

  std::vector<Envelope> outbox;
  outbox.push_back(MakeEnvelope(session_id, kBroadcastPartyId, RecoveryMessageType::kSignRequest,
                                EncodeSigningRequest(request)));
  {
    std::lock_guard<std::mutex> lock(mu_);
    SweepExpiredLocked(std::chrono::steady_clock::now());
    SessionEntry* raw = entry.get();
    sessions_.emplace(key, std::move(entry));
    router_.RegisterSession(session_id, [this, raw](const Envelope& in, std::vector<Envelope>* out) {
      return RouteToEntry(raw, in, out);
    });
    std::vector<Envelope> start = coordinator->Start();
    outbox.insert(outbox.end(), start.begin(), start.end());
  }
  Log()->info("node {} opened session {} for {} ({} of {} signers)", config_.self_id,
              ShortId(session_id), context.account_id, config_.key_set.threshold,
              participants_.size());
  Dispatch(std::move(outbox));

  std::optional<Signature> signature;
  ErrorCode code = ErrorCode::kQuorumTimeout;
  std::string reason;
  {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait_until(lock, coordinator->deadline(),
                   [&]() { return stopping_ || coordinator->IsTerminal(); });
    if (!coordinator->IsTerminal() && !stopping_) {
      coordinator->PollTimeout(std::max(std::chrono::steady_clock::now(), coordinator->deadline()));
    }
    if (coordinator->status() == SessionStatus::kFinalized) {
      signature = coordinator->signature();
    } else if (!coordinator->IsTerminal()) {
      code = ErrorCode::kNodeUnreachable;
      reason = "node shut down while the session was running";
    } else {
      code = coordinator->error_code();
      reason = std::string(SessionStatusName(coordinator->status())) + ": " + coordinator->abort_reason();
    }
    EraseSessionLocked(key);
  }

  if (signature.has_value()) {
    return *signature;
  }

  Dispatch({MakeEnvelope(session_id, kBroadcastPartyId, RecoveryMessageType::kAbort,
                         EncodeAbort(AbortMessage{code, reason}))});
  if (code == ErrorCode::kQuorumTimeout) {
    reason += "; resubmit with a new nonce";
  }
  Log()->warn("node {} session {} failed: {}", config_.self_id, ShortId(session_id), reason);
  throw RecoveryError(code, reason);
}

bool RecoveryNode::RouteToEntry(SessionEntry* entry,
                                const Envelope& envelope,
                                std::vector<Envelope>* outbox) {
  switch (static_cast<RecoveryMessageType>(envelope.type)) {
    case RecoveryMessageType::kCommitment:
    case RecoveryMessageType::kPartial:
      return entry->coordinator && entry->coordinator->HandleEnvelope(envelope, outbox);
    case RecoveryMessageType::kCommitRequest:
    case RecoveryMessageType::kSignPackage:
      return entry->signer && entry->signer->HandleEnvelope(envelope, outbox);
    case RecoveryMessageType::kAbort:
      if (entry->signer && envelope.from == entry->signer->coordinator_id() &&
          envelope.from != config_.self_id) {
        return entry->signer->HandleEnvelope(envelope, outbox);
      }
      return entry->coordinator && entry->coordinator->HandleEnvelope(envelope, outbox);
    default:
      return false;
  }
}

void RecoveryNode::Dispatch(std::vector<Envelope> outbox) {
  for (Envelope& envelope : outbox) {
    if (stopping_) {
      return;
    }
    if (envelope.to == config_.self_id) {
      PostLocal(std::move(envelope));
      continue;
    }
    if (envelope.to == kBroadcastPartyId) {
      transport_->Broadcast(envelope);
      if (envelope.type == MessageTypeValue(RecoveryMessageType::kCommitRequest)) {
        PostLocal(std::move(envelope));
      }
      continue;
    }

    try {
      transport_->Send(envelope.to, envelope);
    } catch (const RecoveryError& ex) {
      if (ex.code() != ErrorCode::kNodeUnreachable) {
        throw;
      }
      Log()->warn("node {} could not deliver {} to party {}: {}", config_.self_id,
                  MessageTypeName(envelope.type), envelope.to, ex.what());

      std::vector<Envelope> follow_up;
      {
        std::lock_guard<std::mutex> lock(mu_);
        const auto it = sessions_.find(SessionRouter::SessionKey(envelope.session_id));
        if (it != sessions_.end() && it->second->coordinator) {
          it->second->coordinator->HandleDeliveryFailure(envelope.to, &follow_up);
          if (it->second->coordinator->IsTerminal()) {
            cv_.notify_all();
          }
        }
      }
      Dispatch(std::move(follow_up));
    }
  }
}

void RecoveryNode::PostLocal(Envelope envelope) {
  if (stopping_) {
    return;
  }
  pool_.Post([this, envelope = std::move(envelope)]() { ProcessEnvelope(envelope); });
}

void RecoveryNode::EraseSessionLocked(const std::string& key) {
  const auto it = sessions_.find(key);
  if (it == sessions_.end()) {
    return;
  }
  router_.UnregisterSession(it->second->coordinator ? it->second->coordinator->session_id()
                                                    : it->second->signer->session_id());
  sessions_.erase(it);
  finished_[key] = std::chrono::steady_clock::now();
}

void RecoveryNode::SweepExpiredLocked(std::chrono::steady_clock::time_point now) {
  std::vector<std::string> expired;
  for (auto& [key, entry] : sessions_) {
    // Coordinator entries belong to the caller waiting in RunSigningSession.
    if (!entry->coordinator && entry->signer &&
        (entry->signer->IsTerminal() || entry->signer->PollTimeout(now))) {
      expired.push_back(key);
    }
  }
  for (const std::string& key : expired) {
    EraseSessionLocked(key);
  }

  const auto retention = config_.freshness_window + config_.max_clock_skew;
  for (auto it = finished_.begin(); it != finished_.end();) {
    if (now - it->second > retention) {
      it = finished_.erase(it);
    } else {
      ++it;
    }
  }
}

Envelope RecoveryNode::MakeEnvelope(const Bytes& session_id,
                                    PartyIndex to,
                                    RecoveryMessageType type,
                                    Bytes payload) const {
  Envelope out;
  out.session_id = session_id;
  out.from = config_.self_id;
  out.to = to;
  out.type = MessageTypeValue(type);
  out.payload = std::move(payload);
  return out;
}

}  // namespace mpcrec
