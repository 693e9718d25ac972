#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "mpcrec/common/clock.hpp"
#include "mpcrec/common/errors.hpp"
#include "mpcrec/common/logging.hpp"
#include "mpcrec/crypto/ec_point.hpp"
#include "mpcrec/crypto/frost.hpp"
#include "mpcrec/crypto/random.hpp"
#include "mpcrec/crypto/scalar.hpp"
#include "mpcrec/derivation/key_derivation.hpp"
#include "mpcrec/net/envelope.hpp"
#include "mpcrec/node/local_cluster.hpp"
#include "mpcrec/node/recovery_node.hpp"
#include "mpcrec/protocol/messages.hpp"
#include "mpcrec/verify/binding_message.hpp"

namespace {

using mpcrec::AddRecoveryMethodRequest;
using mpcrec::AddRecoveryMethodResult;
using mpcrec::Csprng;
using mpcrec::ECPoint;
using mpcrec::Envelope;
using mpcrec::ErrorCode;
using mpcrec::Identity;
using mpcrec::LocalCluster;
using mpcrec::LocalClusterOptions;
using mpcrec::PartyIndex;
using mpcrec::RecoverAccountRequest;
using mpcrec::RecoverAccountResult;
using mpcrec::RecoveryError;
using mpcrec::RecoveryMessageType;
using mpcrec::RecoveryStatus;
using mpcrec::Scalar;

const Identity kAlice{"google", "alice@example.com"};
const Identity kBob{"google", "bob@example.com"};

void Expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error("Test failed: " + message);
  }
}

void ExpectRecoveryError(const std::function<void()>& fn, ErrorCode code, const std::string& message) {
  try {
    fn();
  } catch (const RecoveryError& ex) {
    if (ex.code() != code) {
      throw std::runtime_error("Wrong error code for: " + message + " (got " + ex.what() + ")");
    }
    return;
  }
  throw std::runtime_error("Expected RecoveryError: " + message);
}

// Peers finish their part asynchronously; poll instead of sleeping blindly.
bool WaitFor(const std::function<bool()>& predicate,
             std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return predicate();
}

uint64_t NowSeconds() {
  return mpcrec::ToUnixSeconds(std::chrono::system_clock::now());
}

// A chain account plus the identity the user wants to bind to it.
struct UserAccount {
  std::string account_id;
  Identity identity;
  Scalar account_key;
  std::string token;
};

UserAccount CreateUser(LocalCluster& cluster, const std::string& account_id, const Identity& identity) {
  UserAccount user;
  user.account_id = account_id;
  user.identity = identity;
  user.account_key = Csprng::RandomNonZeroScalar();
  user.token = cluster.IssueToken(identity);
  cluster.chain().CreateAccount(account_id, ECPoint::GeneratorMultiply(user.account_key));
  return user;
}

AddRecoveryMethodRequest MakeAddRequest(const UserAccount& user, uint64_t timestamp = NowSeconds()) {
  AddRecoveryMethodRequest request;
  request.access_token = user.token;
  request.account_id = user.account_id;
  request.proof = mpcrec::SignBindingMessage(user.account_key, user.account_id, user.token,
                                             Csprng::RandomBytes(16), timestamp);
  return request;
}

RecoverAccountRequest MakeRecoverRequest(const UserAccount& user, const ECPoint& new_key) {
  RecoverAccountRequest request;
  request.access_token = user.token;
  request.account_id = user.account_id;
  request.new_public_key = new_key;
  return request;
}

ECPoint FreshPublicKey() {
  return ECPoint::GeneratorMultiply(Csprng::RandomNonZeroScalar());
}

bool AllNodesHold(LocalCluster& cluster, const UserAccount& user, const ECPoint& key) {
  for (PartyIndex id : cluster.party_ids()) {
    const auto stored = cluster.node(id).LookupRecoveryMethod(user.account_id, user.identity);
    if (!stored.has_value() || stored->public_key != key) {
      return false;
    }
  }
  return true;
}

// Registers a recovery method through node 1 and waits for every peer to
// store it; returns the recovery key.
ECPoint RegisterEverywhere(LocalCluster& cluster, const UserAccount& user) {
  const AddRecoveryMethodResult added = cluster.node(1).AddRecoveryMethod(MakeAddRequest(user));
  Expect(added.newly_registered, "First add-method must register a new key");
  Expect(WaitFor([&]() { return AllNodesHold(cluster, user, added.recovery_public_key); }),
         "Every node must store the recovery key");
  return added.recovery_public_key;
}

std::vector<Envelope> ShiftPartialsFrom(const std::vector<PartyIndex>& byzantine, const Envelope& envelope) {
  if (envelope.type == mpcrec::MessageTypeValue(RecoveryMessageType::kPartial)) {
    for (PartyIndex id : byzantine) {
      if (envelope.from == id) {
        mpcrec::PartialMessage partial = mpcrec::DecodePartial(envelope.payload);
        partial.share = partial.share + Scalar::FromUint64(7);
        Envelope out = envelope;
        out.payload = mpcrec::EncodePartial(partial);
        return {out};
      }
    }
  }
  return {envelope};
}

void TestAddRecoveryMethodRegistersOnEveryNode() {
  LocalCluster cluster;
  const UserAccount alice = CreateUser(cluster, "alice.near", kAlice);

  const AddRecoveryMethodResult added = cluster.node(1).AddRecoveryMethod(MakeAddRequest(alice));
  Expect(added.newly_registered, "A net-new binding must be reported as registered");
  Expect(added.recovery_public_key == cluster.node(1).DeriveRecoveryPublicKey(alice.account_id, kAlice),
         "Returned key must equal the derived recovery key");
  Expect(added.attestation.has_value(), "A net-new binding must carry the network attestation");
  Expect(mpcrec::VerifySignature(cluster.key_set().group_public_key, added.attested_payload,
                                 *added.attestation),
         "Attestation must verify under the network key");

  const mpcrec::KeyAddition addition = mpcrec::ParseKeyAdditionMessage(added.attested_payload);
  Expect(addition.kind == mpcrec::RequestKind::kAddRecoveryMethod, "Attested payload must be an add-method");
  Expect(addition.account_id == alice.account_id, "Attested payload must name the account");
  Expect(addition.public_key == added.recovery_public_key, "Attested payload must carry the recovery key");

  Expect(WaitFor([&]() { return AllNodesHold(cluster, alice, added.recovery_public_key); }),
         "Every peer must register the same recovery key");
  std::map<PartyIndex, ECPoint> partials;
  for (PartyIndex id : cluster.party_ids()) {
    Expect(cluster.node(id).DeriveRecoveryPublicKey(alice.account_id, kAlice) == added.recovery_public_key,
           "Every node must derive the same recovery key");
    if (partials.size() < cluster.key_set().threshold) {
      partials.emplace(id, cluster.node(id).DerivePartialPublicKey(alice.account_id, kAlice));
    }
  }
  Expect(mpcrec::DefaultKeyDerivationScheme()->CombineShares(cluster.key_set(), partials) ==
             added.recovery_public_key,
         "A threshold of partial keys must combine to the recovery key");
  Expect(cluster.node(1).active_session_count() == 0, "Initiator must release its session once it returns");
}

void TestRepeatedAddReturnsStoredKey() {
  LocalCluster cluster;
  const UserAccount alice = CreateUser(cluster, "alice.near", kAlice);
  const ECPoint key = RegisterEverywhere(cluster, alice);

  for (PartyIndex id : {PartyIndex{1}, PartyIndex{3}}) {
    const AddRecoveryMethodResult again = cluster.node(id).AddRecoveryMethod(MakeAddRequest(alice));
    Expect(!again.newly_registered, "A repeated binding must not register again");
    Expect(again.recovery_public_key == key, "A repeated binding must return the stored key");
    Expect(!again.attestation.has_value(), "A repeated binding runs no signing session");
  }
}

void TestDifferentBindingsGetDifferentKeys() {
  LocalCluster cluster;
  const UserAccount alice = CreateUser(cluster, "alice.near", kAlice);
  const UserAccount bob = CreateUser(cluster, "bob.near", kBob);
  UserAccount alice_on_bob = bob;
  alice_on_bob.identity = kAlice;
  alice_on_bob.token = alice.token;

  const ECPoint alice_key = RegisterEverywhere(cluster, alice);
  const ECPoint bob_key = RegisterEverywhere(cluster, bob);
  const ECPoint cross_key = RegisterEverywhere(cluster, alice_on_bob);
  Expect(alice_key != bob_key, "Different accounts and identities must get different keys");
  Expect(alice_key != cross_key, "The same identity on another account must get another key");
  Expect(bob_key != cross_key, "Another identity on the same account must get another key");
}

void TestAddRecoveryMethodRejections() {
  LocalCluster cluster;
  const UserAccount alice = CreateUser(cluster, "alice.near", kAlice);
  const UserAccount mallory = CreateUser(cluster, "mallory.near", Identity{"google", "mallory@example.com"});

  AddRecoveryMethodRequest bad_token = MakeAddRequest(alice);
  bad_token.access_token = "not-a-token";
  ExpectRecoveryError([&]() { (void)cluster.node(1).AddRecoveryMethod(bad_token); },
                      ErrorCode::kInvalidToken, "Unknown token must be rejected");

  const std::string foreign = cluster.IssueToken(Identity{"github", "alice"});
  AddRecoveryMethodRequest untrusted = MakeAddRequest(alice);
  untrusted.access_token = foreign;
  untrusted.proof = mpcrec::SignBindingMessage(alice.account_key, alice.account_id, foreign,
                                               Csprng::RandomBytes(16), NowSeconds());
  ExpectRecoveryError([&]() { (void)cluster.node(1).AddRecoveryMethod(untrusted); },
                      ErrorCode::kInvalidToken, "Token from an untrusted provider must be rejected");

  // Mallory signs a binding for Alice's account with Mallory's own key.
  AddRecoveryMethodRequest hijack;
  hijack.access_token = mallory.token;
  hijack.account_id = alice.account_id;
  hijack.proof = mpcrec::SignBindingMessage(mallory.account_key, alice.account_id, mallory.token,
                                            Csprng::RandomBytes(16), NowSeconds());
  ExpectRecoveryError([&]() { (void)cluster.node(1).AddRecoveryMethod(hijack); },
                      ErrorCode::kUnauthorizedKey, "A key not authorized on the account must be rejected");

  AddRecoveryMethodRequest tampered = MakeAddRequest(alice);
  tampered.proof.signature[5] ^= 0x01;
  ExpectRecoveryError([&]() { (void)cluster.node(1).AddRecoveryMethod(tampered); },
                      ErrorCode::kInvalidSignature, "A tampered binding signature must be rejected");

  AddRecoveryMethodRequest stale = MakeAddRequest(alice, NowSeconds() - 3600);
  ExpectRecoveryError([&]() { (void)cluster.node(1).AddRecoveryMethod(stale); },
                      ErrorCode::kReplayedRequest, "A stale binding must be rejected");

  AddRecoveryMethodRequest no_account = MakeAddRequest(alice);
  no_account.account_id.clear();
  ExpectRecoveryError([&]() { (void)cluster.node(1).AddRecoveryMethod(no_account); },
                      ErrorCode::kInvalidRequest, "An empty account must be rejected");

  for (PartyIndex id : cluster.party_ids()) {
    Expect(!cluster.node(id).LookupRecoveryMethod(alice.account_id, kAlice).has_value(),
           "Rejected requests must not register anything");
  }
}

void TestOversizedAccountIdIsRejectedUpFront() {
  LocalCluster cluster;
  const std::string long_account(300, 'a');
  const UserAccount long_user = CreateUser(cluster, long_account, kAlice);

  const AddRecoveryMethodRequest request = MakeAddRequest(long_user);
  ExpectRecoveryError([&]() { (void)cluster.node(1).AddRecoveryMethod(request); },
                      ErrorCode::kInvalidRequest, "Add-method with a 300-byte account id must be rejected");
  ExpectRecoveryError([&]() { (void)cluster.node(1).AddRecoveryMethod(request); },
                      ErrorCode::kInvalidRequest, "Resubmission must fail the same way, not as a replay");
  ExpectRecoveryError([&]() { (void)cluster.node(1).RecoverAccount(MakeRecoverRequest(long_user, FreshPublicKey())); },
                      ErrorCode::kInvalidRequest, "Recovery with a 300-byte account id must be rejected");

  // A proof rejected for its envelope keeps its nonce usable.
  const UserAccount alice = CreateUser(cluster, "alice.near", kAlice);
  AddRecoveryMethodRequest valid = MakeAddRequest(alice);
  AddRecoveryMethodRequest oversized = valid;
  oversized.account_id = long_account;
  ExpectRecoveryError([&]() { (void)cluster.node(1).AddRecoveryMethod(oversized); },
                      ErrorCode::kInvalidRequest, "Oversized account id must be rejected before verification");
  const AddRecoveryMethodResult added = cluster.node(1).AddRecoveryMethod(valid);
  Expect(added.newly_registered, "The untouched proof must still be accepted");
}

void TestShutdownDuringSessionReportsUnreachable() {
  LocalCluster cluster;
  const UserAccount alice = CreateUser(cluster, "alice.near", kAlice);
  (void)RegisterEverywhere(cluster, alice);

  cluster.SetOnline(3, false);
  cluster.SetOnline(4, false);
  std::optional<ErrorCode> observed;
  std::string detail;
  std::thread caller([&]() {
    try {
      (void)cluster.node(1).RecoverAccount(MakeRecoverRequest(alice, FreshPublicKey()));
    } catch (const RecoveryError& ex) {
      observed = ex.code();
      detail = ex.what();
    }
  });

  Expect(WaitFor([&]() { return cluster.node(1).active_session_count() == 1; }),
         "Recovery session must be open before shutdown");
  const auto started = std::chrono::steady_clock::now();
  cluster.node(1).Shutdown();
  caller.join();

  Expect(observed.has_value() && *observed == ErrorCode::kNodeUnreachable,
         "Shutdown must surface as NodeUnreachable, got: " + detail);
  Expect(detail.find("new nonce") == std::string::npos, "Shutdown must not be reported as a timeout");
  Expect(std::chrono::steady_clock::now() - started < std::chrono::seconds(5),
         "Shutdown must not wait for the session deadline");
}

void TestReplayedProofIsRefusedEverywhere() {
  LocalCluster cluster;
  const UserAccount alice = CreateUser(cluster, "alice.near", kAlice);
  const AddRecoveryMethodRequest request = MakeAddRequest(alice);

  const AddRecoveryMethodResult added = cluster.node(1).AddRecoveryMethod(request);
  Expect(added.newly_registered, "First submission must register");
  ExpectRecoveryError([&]() { (void)cluster.node(1).AddRecoveryMethod(request); },
                      ErrorCode::kReplayedRequest, "Same proof at the same node must be refused");

  Expect(WaitFor([&]() { return cluster.node(2).LookupRecoveryMethod(alice.account_id, kAlice).has_value(); }),
         "Peer 2 must have verified the first submission");
  ExpectRecoveryError([&]() { (void)cluster.node(2).AddRecoveryMethod(request); },
                      ErrorCode::kReplayedRequest, "Same proof at a peer that saw it must be refused");
}

void TestRecoverSignsUnderStoredKey() {
  LocalCluster cluster;
  const UserAccount alice = CreateUser(cluster, "alice.near", kAlice);
  const ECPoint recovery_key = RegisterEverywhere(cluster, alice);

  const ECPoint new_key = FreshPublicKey();
  const RecoverAccountResult recovered = cluster.node(2).RecoverAccount(MakeRecoverRequest(alice, new_key));
  Expect(recovered.status == RecoveryStatus::kSigned, "Without a submitter the signature is returned");
  Expect(recovered.recovery_public_key == recovery_key, "Recovery must use the stored key");
  Expect(mpcrec::VerifySignature(recovery_key, recovered.payload, recovered.signature),
         "Recovery signature must verify under the recovery key");

  const mpcrec::KeyAddition addition = mpcrec::ParseKeyAdditionMessage(recovered.payload);
  Expect(addition.kind == mpcrec::RequestKind::kRecoverAccount, "Payload must be a recovery key addition");
  Expect(addition.account_id == alice.account_id, "Payload must name the account");
  Expect(addition.public_key == new_key, "Payload must carry the requested key");
  Expect(!mpcrec::VerifySignature(cluster.key_set().group_public_key, recovered.payload, recovered.signature),
         "Recovery signature must not verify under the untweaked network key");
}

void TestRecoverSubmitsToChain() {
  LocalClusterOptions options;
  options.submit_to_chain = true;
  LocalCluster cluster(options);
  const UserAccount alice = CreateUser(cluster, "alice.near", kAlice);
  const ECPoint recovery_key = RegisterEverywhere(cluster, alice);

  const ECPoint new_key = FreshPublicKey();
  ExpectRecoveryError(
      [&]() { (void)cluster.node(1).RecoverAccount(MakeRecoverRequest(alice, new_key)); },
      ErrorCode::kUnauthorizedKey, "The chain must refuse a recovery key it does not know");
  Expect(!cluster.chain().HasKey(alice.account_id, new_key), "Refused submission must not add the key");

  // The user publishes the attested recovery key on chain.
  cluster.chain().AddKey(alice.account_id, recovery_key);
  const RecoverAccountResult recovered = cluster.node(1).RecoverAccount(MakeRecoverRequest(alice, new_key));
  Expect(recovered.status == RecoveryStatus::kSubmitted, "With a submitter the key addition is submitted");
  Expect(cluster.chain().HasKey(alice.account_id, new_key), "Chain must now authorize the new key");
}

void TestRecoverRejections() {
  LocalCluster cluster;
  const UserAccount alice = CreateUser(cluster, "alice.near", kAlice);
  const UserAccount bob = CreateUser(cluster, "bob.near", kBob);
  (void)RegisterEverywhere(cluster, alice);

  ExpectRecoveryError([&]() { (void)cluster.node(1).RecoverAccount(MakeRecoverRequest(bob, FreshPublicKey())); },
                      ErrorCode::kMethodNotFound, "Recovery without a registered method must fail");

  RecoverAccountRequest bad_token = MakeRecoverRequest(alice, FreshPublicKey());
  bad_token.access_token = "forged";
  ExpectRecoveryError([&]() { (void)cluster.node(1).RecoverAccount(bad_token); },
                      ErrorCode::kInvalidToken, "Recovery with a forged token must fail");

  cluster.identity_provider().Revoke(alice.token);
  ExpectRecoveryError([&]() { (void)cluster.node(1).RecoverAccount(MakeRecoverRequest(alice, FreshPublicKey())); },
                      ErrorCode::kInvalidToken, "Recovery with a revoked token must fail");
}

void TestRevokedMethodAtPeers() {
  LocalCluster cluster;
  UserAccount alice = CreateUser(cluster, "alice.near", kAlice);
  const ECPoint recovery_key = RegisterEverywhere(cluster, alice);

  // One peer short of the method: the other three still reach 3-of-4.
  Expect(cluster.node(4).RevokeRecoveryMethod(alice.account_id, kAlice), "Revoke must remove the method");
  const RecoverAccountResult recovered = cluster.node(1).RecoverAccount(MakeRecoverRequest(alice, FreshPublicKey()));
  Expect(mpcrec::VerifySignature(recovery_key, recovered.payload, recovered.signature),
         "Recovery must succeed while a quorum still holds the method");

  Expect(cluster.node(3).RevokeRecoveryMethod(alice.account_id, kAlice), "Revoke must remove the method");
  ExpectRecoveryError([&]() { (void)cluster.node(1).RecoverAccount(MakeRecoverRequest(alice, FreshPublicKey())); },
                      ErrorCode::kMethodNotFound, "Recovery must fail once too few nodes hold the method");

  Expect(cluster.node(1).RevokeRecoveryMethod(alice.account_id, kAlice), "Revoke must remove the method");
  ExpectRecoveryError([&]() { (void)cluster.node(1).RecoverAccount(MakeRecoverRequest(alice, FreshPublicKey())); },
                      ErrorCode::kMethodNotFound, "Initiator without the method must fail before signing");
}

void TestQuorumTimeoutThenRetry() {
  LocalClusterOptions options;
  options.session_timeout = std::chrono::milliseconds(1500);
  LocalCluster cluster(options);
  const UserAccount alice = CreateUser(cluster, "alice.near", kAlice);
  const ECPoint recovery_key = RegisterEverywhere(cluster, alice);

  cluster.SetOnline(3, false);
  cluster.SetOnline(4, false);
  Expect(!cluster.network().IsReachable(3) && !cluster.network().IsReachable(4), "Nodes 3 and 4 must be offline");
  const auto started = std::chrono::steady_clock::now();
  try {
    (void)cluster.node(1).RecoverAccount(MakeRecoverRequest(alice, FreshPublicKey()));
    throw std::runtime_error("Test failed: recovery with two nodes offline must not succeed");
  } catch (const RecoveryError& ex) {
    Expect(ex.code() == ErrorCode::kQuorumTimeout, std::string("Expected QuorumTimeout, got ") + ex.what());
    Expect(mpcrec::IsRetryable(ex.code()), "QuorumTimeout must be retryable");
    Expect(std::string(ex.what()).find("new nonce") != std::string::npos,
           "Timeout must tell the caller to resubmit");
  }
  Expect(std::chrono::steady_clock::now() - started >= std::chrono::milliseconds(1400),
         "Session must wait for its deadline before timing out");

  cluster.SetOnline(3, true);
  const RecoverAccountResult recovered = cluster.node(1).RecoverAccount(MakeRecoverRequest(alice, FreshPublicKey()));
  Expect(mpcrec::VerifySignature(recovery_key, recovered.payload, recovered.signature),
         "Retry must succeed once a quorum is back");
}

void TestOfflinePeerDuringAddMethod() {
  LocalCluster cluster;
  const UserAccount alice = CreateUser(cluster, "alice.near", kAlice);

  cluster.SetOnline(4, false);
  const AddRecoveryMethodResult added = cluster.node(1).AddRecoveryMethod(MakeAddRequest(alice));
  Expect(added.newly_registered, "Three of four nodes must be enough to register");
  Expect(WaitFor([&]() {
           for (PartyIndex id : {PartyIndex{1}, PartyIndex{2}, PartyIndex{3}}) {
             if (!cluster.node(id).LookupRecoveryMethod(alice.account_id, kAlice).has_value()) {
               return false;
             }
           }
           return true;
         }),
         "Online nodes must register the method");
  Expect(!cluster.node(4).LookupRecoveryMethod(alice.account_id, kAlice).has_value(),
         "An offline node must not register the method");

  cluster.SetOnline(4, true);
  ExpectRecoveryError([&]() { (void)cluster.node(4).RecoverAccount(MakeRecoverRequest(alice, FreshPublicKey())); },
                      ErrorCode::kMethodNotFound, "A node that missed the registration cannot initiate recovery");

  // Node 4 declines as a peer; the other three still sign.
  const RecoverAccountResult recovered = cluster.node(1).RecoverAccount(MakeRecoverRequest(alice, FreshPublicKey()));
  Expect(mpcrec::VerifySignature(added.recovery_public_key, recovered.payload, recovered.signature),
         "Recovery must succeed without the node that missed the registration");
}

void TestPeerRegistrationOutlivesTimedOutSession() {
  LocalClusterOptions options;
  options.session_timeout = std::chrono::milliseconds(1000);
  LocalCluster cluster(options);
  const UserAccount alice = CreateUser(cluster, "alice.near", kAlice);

  cluster.SetOnline(3, false);
  cluster.SetOnline(4, false);
  ExpectRecoveryError([&]() { (void)cluster.node(1).AddRecoveryMethod(MakeAddRequest(alice)); },
                      ErrorCode::kQuorumTimeout, "Add-method without a quorum must time out");
  Expect(WaitFor([&]() { return cluster.node(2).LookupRecoveryMethod(alice.account_id, kAlice).has_value(); }),
         "A peer that passed its checks keeps the registration");
  Expect(!cluster.node(1).LookupRecoveryMethod(alice.account_id, kAlice).has_value(),
         "The initiator registers only on finalize");

  cluster.SetOnline(3, true);
  cluster.SetOnline(4, true);
  const AddRecoveryMethodResult added = cluster.node(1).AddRecoveryMethod(MakeAddRequest(alice));
  Expect(added.newly_registered, "Resubmission must complete the registration at the initiator");
  Expect(cluster.node(2).LookupRecoveryMethod(alice.account_id, kAlice)->public_key == added.recovery_public_key,
         "The early peer record must match the final key");
}

void TestByzantinePartialIsExcluded() {
  LocalCluster cluster;
  const UserAccount alice = CreateUser(cluster, "alice.near", kAlice);
  const ECPoint recovery_key = RegisterEverywhere(cluster, alice);

  cluster.network().SetInterceptor(
      [](const Envelope& envelope) { return ShiftPartialsFrom({2}, envelope); });
  const RecoverAccountResult recovered = cluster.node(1).RecoverAccount(MakeRecoverRequest(alice, FreshPublicKey()));
  Expect(mpcrec::VerifySignature(recovery_key, recovered.payload, recovered.signature),
         "A single bad partial must not stop an honest quorum");

  cluster.network().SetInterceptor(
      [](const Envelope& envelope) { return ShiftPartialsFrom({2, 3}, envelope); });
  ExpectRecoveryError([&]() { (void)cluster.node(1).RecoverAccount(MakeRecoverRequest(alice, FreshPublicKey())); },
                      ErrorCode::kInvalidSignature, "Two bad partials leave no honest quorum");
}

void TestConcurrentRequests() {
  LocalCluster cluster;
  std::vector<UserAccount> users;
  for (int i = 0; i < 4; ++i) {
    users.push_back(CreateUser(cluster, "user" + std::to_string(i) + ".near",
                               Identity{"google", "user" + std::to_string(i) + "@example.com"}));
  }

  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (size_t i = 0; i < users.size(); ++i) {
    threads.emplace_back([&, i]() {
      try {
        const PartyIndex initiator = static_cast<PartyIndex>(i % 4 + 1);
        const AddRecoveryMethodResult added = cluster.node(initiator).AddRecoveryMethod(MakeAddRequest(users[i]));
        const RecoverAccountResult recovered =
            cluster.node(initiator).RecoverAccount(MakeRecoverRequest(users[i], FreshPublicKey()));
        if (!mpcrec::VerifySignature(added.recovery_public_key, recovered.payload, recovered.signature)) {
          ++failures;
        }
      } catch (const std::exception& ex) {
        std::cerr << "concurrent request " << i << " failed: " << ex.what() << '\n';
        ++failures;
      }
    });
  }
  for (std::thread& thread : threads) {
    thread.join();
  }
  Expect(failures.load() == 0, "Concurrent requests from different initiators must all succeed");
}

}  // namespace

int main() {
  try {
    mpcrec::SetLogLevel(spdlog::level::warn);
    TestAddRecoveryMethodRegistersOnEveryNode();
    TestRepeatedAddReturnsStoredKey();
    TestDifferentBindingsGetDifferentKeys();
    TestAddRecoveryMethodRejections();
    TestOversizedAccountIdIsRejectedUpFront();
    TestReplayedProofIsRefusedEverywhere();
    TestShutdownDuringSessionReportsUnreachable();
    TestRecoverSignsUnderStoredKey();
    TestRecoverSubmitsToChain();
    TestRecoverRejections();
    TestRevokedMethodAtPeers();
    TestQuorumTimeoutThenRetry();
    TestOfflinePeerDuringAddMethod();
    TestPeerRegistrationOutlivesTimedOutSession();
    TestByzantinePartialIsExcluded();
    TestConcurrentRequests();
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  std::cout << "Node end-to-end tests passed" << '\n';
  return 0;
}
