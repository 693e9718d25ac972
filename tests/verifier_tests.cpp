#include <chrono>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "mpcrec/common/clock.hpp"
#include "mpcrec/common/errors.hpp"
#include "mpcrec/common/retry.hpp"
#include "mpcrec/crypto/ec_point.hpp"
#include "mpcrec/crypto/frost.hpp"
#include "mpcrec/crypto/random.hpp"
#include "mpcrec/crypto/scalar.hpp"
#include "mpcrec/derivation/trusted_dealer.hpp"
#include "mpcrec/protocol/messages.hpp"
#include "mpcrec/verify/binding_message.hpp"
#include "mpcrec/verify/chain.hpp"
#include "mpcrec/verify/identity_provider.hpp"
#include "mpcrec/verify/identity_verifier.hpp"
#include "mpcrec/verify/ownership_verifier.hpp"
#include "mpcrec/verify/replay_guard.hpp"

namespace {

using mpcrec::BindingProof;
using mpcrec::Bytes;
using mpcrec::ECPoint;
using mpcrec::ErrorCode;
using mpcrec::Identity;
using mpcrec::IdentityVerifier;
using mpcrec::IdentityVerifierConfig;
using mpcrec::InMemoryChain;
using mpcrec::OwnershipVerifier;
using mpcrec::OwnershipVerifierConfig;
using mpcrec::RecoveryError;
using mpcrec::ReplayGuard;
using mpcrec::Scalar;
using mpcrec::StaticIdentityProvider;
using mpcrec::TokenClaims;

constexpr uint64_t kNow = 1700000000;

void Expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error("Test failed: " + message);
  }
}

void ExpectThrow(const std::function<void()>& fn, const std::string& message) {
  try {
    fn();
  } catch (const std::exception&) {
    return;
  }
  throw std::runtime_error("Expected exception: " + message);
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

mpcrec::WallClock FixedClock(const uint64_t* now) {
  return [now]() { return mpcrec::FromUnixSeconds(*now); };
}

mpcrec::Sleeper NoSleep() {
  return [](std::chrono::milliseconds) {};
}

TokenClaims Claims(const std::string& issuer, const std::string& subject) {
  TokenClaims claims;
  claims.issuer = issuer;
  claims.subject = subject;
  claims.audience = "mpcrec";
  claims.issued_at = kNow - 10;
  claims.expires_at = kNow + 3600;
  return claims;
}

IdentityVerifierConfig VerifierConfig() {
  IdentityVerifierConfig config;
  config.trusted_providers = {"google", "apple"};
  config.audience = "mpcrec";
  config.retry.max_attempts = 3;
  return config;
}

void TestIdentityVerifierAcceptsValidToken() {
  auto provider = std::make_shared<StaticIdentityProvider>();
  provider->Issue("tok-alice", Claims("google", "alice@example.com"));
  const uint64_t now = kNow;
  const IdentityVerifier verifier(VerifierConfig(), provider, FixedClock(&now), NoSleep());

  const Identity identity = verifier.Verify("tok-alice");
  Expect(identity == Identity{"google", "alice@example.com"}, "Identity must come from issuer and subject");
  Expect(verifier.Verify("tok-alice", identity) == identity, "Matching expected identity must pass");
  ExpectRecoveryError([&]() { (void)verifier.Verify("tok-alice", Identity{"google", "mallory"}); },
                      ErrorCode::kInvalidToken, "Identity mismatch must be rejected");
}

void TestIdentityVerifierRejectsBadTokens() {
  auto provider = std::make_shared<StaticIdentityProvider>();
  provider->Issue("tok-untrusted", Claims("evil-idp", "alice"));
  TokenClaims wrong_audience = Claims("google", "alice");
  wrong_audience.audience = "someone-else";
  provider->Issue("tok-audience", wrong_audience);
  TokenClaims expired = Claims("google", "alice");
  expired.expires_at = kNow;
  provider->Issue("tok-expired", expired);
  TokenClaims future = Claims("google", "alice");
  future.issued_at = kNow + 120;
  provider->Issue("tok-future", future);
  TokenClaims skewed = Claims("google", "alice");
  skewed.issued_at = kNow + 20;
  provider->Issue("tok-skewed", skewed);
  provider->Issue("tok-nosubject", Claims("google", ""));

  const uint64_t now = kNow;
  const IdentityVerifier verifier(VerifierConfig(), provider, FixedClock(&now), NoSleep());

  ExpectRecoveryError([&]() { (void)verifier.Verify("tok-unknown"); }, ErrorCode::kInvalidToken,
                      "Unknown token must be rejected");
  ExpectRecoveryError([&]() { (void)verifier.Verify("tok-untrusted"); }, ErrorCode::kInvalidToken,
                      "Untrusted issuer must be rejected");
  ExpectRecoveryError([&]() { (void)verifier.Verify("tok-audience"); }, ErrorCode::kInvalidToken,
                      "Wrong audience must be rejected");
  ExpectRecoveryError([&]() { (void)verifier.Verify("tok-expired"); }, ErrorCode::kInvalidToken,
                      "Expired token must be rejected");
  ExpectRecoveryError([&]() { (void)verifier.Verify("tok-future"); }, ErrorCode::kInvalidToken,
                      "Token issued beyond the skew must be rejected");
  ExpectRecoveryError([&]() { (void)verifier.Verify("tok-nosubject"); }, ErrorCode::kInvalidToken,
                      "Token without subject must be rejected");
  ExpectRecoveryError([&]() { (void)verifier.Verify(""); }, ErrorCode::kInvalidToken,
                      "Empty token must be rejected");
  ExpectRecoveryError([&]() { (void)verifier.Verify(std::string(mpcrec::kMaxAccessTokenLen + 1, 'x')); },
                      ErrorCode::kInvalidToken, "Oversized token must be rejected");
  Expect(verifier.Verify("tok-skewed").subject == "alice", "Issue time within the skew must be accepted");

  provider->Revoke("tok-skewed");
  ExpectRecoveryError([&]() { (void)verifier.Verify("tok-skewed"); }, ErrorCode::kInvalidToken,
                      "Revoked token must be rejected");
}

void TestIdentityVerifierRetriesUnreachableProvider() {
  auto provider = std::make_shared<StaticIdentityProvider>();
  provider->Issue("tok", Claims("google", "alice"));
  const uint64_t now = kNow;
  int sleeps = 0;
  const IdentityVerifier verifier(VerifierConfig(), provider, FixedClock(&now),
                                  [&](std::chrono::milliseconds) { ++sleeps; });

  provider->FailNextCalls(2);
  Expect(verifier.Verify("tok").subject == "alice", "Verification must succeed after transient failures");
  Expect(provider->call_count() == 3, "Two failures plus one success means three calls");
  Expect(sleeps == 2, "Verifier must back off between attempts");

  provider->SetUnreachable(true);
  ExpectRecoveryError([&]() { (void)verifier.Verify("tok"); }, ErrorCode::kProviderUnreachable,
                      "Persistent outage must surface as ProviderUnreachable");

  ExpectThrow([&]() {
    IdentityVerifierConfig config = VerifierConfig();
    config.trusted_providers.clear();
    IdentityVerifier bad(config, provider);
  }, "A verifier without trusted providers must be rejected");
}

void TestBindingMessageLayout() {
  const Bytes nonce(16, 0xAB);
  const Bytes message = mpcrec::BuildBindingMessage("alice.near", "token", nonce, kNow);
  const Bytes same = mpcrec::BuildBindingMessage("alice.near", "token", nonce, kNow);
  Expect(message == same, "Binding message must be deterministic");
  Expect(message != mpcrec::BuildBindingMessage("alice.near", "other", nonce, kNow),
         "Binding message must depend on the token");
  Expect(message != mpcrec::BuildBindingMessage("bob.near", "token", nonce, kNow),
         "Binding message must depend on the account");
  Expect(message != mpcrec::BuildBindingMessage("alice.near", "token", nonce, kNow + 1),
         "Binding message must depend on the timestamp");

  const std::string as_text(message.begin(), message.end());
  Expect(as_text.find("mpcrec/bind-oauth/v1") != std::string::npos,
         "Binding message must carry its versioned domain");
  Expect(as_text.find("token") == std::string::npos, "Binding message must not carry the raw token");

  ExpectThrow([&]() { (void)mpcrec::BuildBindingMessage("alice.near", "token", Bytes(8, 0), kNow); },
              "Short nonce must be rejected");
  ExpectThrow([&]() { (void)mpcrec::BuildBindingMessage("", "token", nonce, kNow); },
              "Empty account must be rejected");
}

void TestReplayGuard() {
  ReplayGuard guard(std::chrono::seconds(300));
  const Bytes nonce(16, 0x01);
  Expect(guard.TryRecord("alice.near", nonce, kNow, kNow), "First use must be recorded");
  Expect(guard.Contains("alice.near", nonce), "Recorded nonce must be remembered");
  Expect(!guard.TryRecord("alice.near", nonce, kNow, kNow), "Second use must be refused");
  Expect(guard.TryRecord("bob.near", nonce, kNow, kNow), "Nonces are scoped per account");
  Expect(guard.size() == 2, "Guard must hold both entries");

  const Bytes later(16, 0x02);
  Expect(guard.TryRecord("alice.near", later, kNow + 400, kNow + 400), "Later nonce must be recorded");
  Expect(!guard.Contains("alice.near", nonce), "Entries past retention must be pruned");
  Expect(guard.size() == 1, "Only the fresh entry must remain");
  ExpectThrow([]() { ReplayGuard bad(std::chrono::seconds(0)); }, "Zero retention must be rejected");
}

struct OwnershipFixture {
  std::shared_ptr<InMemoryChain> chain = std::make_shared<InMemoryChain>();
  Scalar account_key = mpcrec::Csprng::RandomNonZeroScalar();
  uint64_t now = kNow;
  std::unique_ptr<OwnershipVerifier> verifier;

  OwnershipFixture() {
    chain->CreateAccount("alice.near", ECPoint::GeneratorMultiply(account_key));
    OwnershipVerifierConfig config;
    config.retry.max_attempts = 2;
    verifier = std::make_unique<OwnershipVerifier>(config, chain, FixedClock(&now), NoSleep());
  }

  BindingProof Proof(const std::string& token, uint64_t timestamp) const {
    return mpcrec::SignBindingMessage(account_key, "alice.near", token,
                                      mpcrec::Csprng::RandomBytes(16), timestamp);
  }
};

void TestOwnershipVerifierAcceptsOnce() {
  OwnershipFixture fixture;
  const BindingProof proof = fixture.Proof("tok", kNow);
  fixture.verifier->Verify("alice.near", "tok", proof);
  Expect(fixture.verifier->replay_guard().Contains("alice.near", proof.nonce),
         "Accepted proof must be recorded");
  ExpectRecoveryError([&]() { fixture.verifier->Verify("alice.near", "tok", proof); },
                      ErrorCode::kReplayedRequest, "Replaying an accepted proof must be rejected");
}

void TestOwnershipVerifierRejectsExpiredAcceptedProof() {
  OwnershipFixture fixture;
  const BindingProof accepted = fixture.Proof("tok", kNow);
  fixture.verifier->Verify("alice.near", "tok", accepted);

  // Past freshness window plus skew; the next accepted proof prunes the old nonce.
  fixture.now = kNow + 300 + 30 + 1;
  fixture.verifier->Verify("alice.near", "tok", fixture.Proof("tok", fixture.now));
  Expect(!fixture.verifier->replay_guard().Contains("alice.near", accepted.nonce),
         "Nonce of an expired proof must be pruned from the replay guard");

  ExpectRecoveryError([&]() { fixture.verifier->Verify("alice.near", "tok", accepted); },
                      ErrorCode::kReplayedRequest, "Resubmitting an expired accepted proof must be rejected");
  Expect(!fixture.verifier->replay_guard().Contains("alice.near", accepted.nonce),
         "A rejected resubmission must not be recorded again");
}

void TestOwnershipVerifierRejectsOversizedAccount() {
  OwnershipFixture fixture;
  const std::string long_account(300, 'a');
  const BindingProof proof = mpcrec::SignBindingMessage(fixture.account_key, long_account, "tok",
                                                        mpcrec::Csprng::RandomBytes(16), kNow);
  ExpectRecoveryError([&]() { fixture.verifier->Verify(long_account, "tok", proof); },
                      ErrorCode::kInvalidRequest, "Account id over 256 bytes must be rejected");
  Expect(fixture.verifier->replay_guard().size() == 0, "Oversized account must not consume a nonce");
}

void TestOwnershipVerifierRejections() {
  OwnershipFixture fixture;

  ExpectRecoveryError([&]() { fixture.verifier->Verify("alice.near", "tok", fixture.Proof("tok", kNow - 301)); },
                      ErrorCode::kReplayedRequest, "Stale timestamp must be rejected");
  ExpectRecoveryError([&]() { fixture.verifier->Verify("alice.near", "tok", fixture.Proof("tok", kNow + 31)); },
                      ErrorCode::kReplayedRequest, "Timestamp beyond the skew must be rejected");
  fixture.verifier->Verify("alice.near", "tok", fixture.Proof("tok", kNow - 300));

  ExpectRecoveryError([&]() { fixture.verifier->Verify("alice.near", "other-token", fixture.Proof("tok", kNow)); },
                      ErrorCode::kInvalidSignature, "Proof for another token must be rejected");
  ExpectRecoveryError([&]() { fixture.verifier->Verify("bob.near", "tok", fixture.Proof("tok", kNow)); },
                      ErrorCode::kInvalidSignature, "Proof for another account must be rejected");

  BindingProof tampered = fixture.Proof("tok", kNow);
  tampered.signature[10] ^= 0x01;
  ExpectRecoveryError([&]() { fixture.verifier->Verify("alice.near", "tok", tampered); },
                      ErrorCode::kInvalidSignature, "Tampered signature must be rejected");

  BindingProof short_nonce = fixture.Proof("tok", kNow);
  short_nonce.nonce.resize(8);
  ExpectRecoveryError([&]() { fixture.verifier->Verify("alice.near", "tok", short_nonce); },
                      ErrorCode::kInvalidRequest, "Short nonce must be rejected");

  const Scalar stranger = mpcrec::Csprng::RandomNonZeroScalar();
  const BindingProof unauthorized = mpcrec::SignBindingMessage(
      stranger, "alice.near", "tok", mpcrec::Csprng::RandomBytes(16), kNow);
  ExpectRecoveryError([&]() { fixture.verifier->Verify("alice.near", "tok", unauthorized); },
                      ErrorCode::kUnauthorizedKey, "Key not on the account must be rejected");
  Expect(!fixture.verifier->replay_guard().Contains("alice.near", unauthorized.nonce),
         "Rejected proofs must not consume their nonce");

  fixture.chain->RemoveKey("alice.near", ECPoint::GeneratorMultiply(fixture.account_key));
  ExpectRecoveryError([&]() { fixture.verifier->Verify("alice.near", "tok", fixture.Proof("tok", kNow)); },
                      ErrorCode::kUnauthorizedKey, "Key removed from the account must be rejected");
}

void TestOwnershipVerifierChainOutage() {
  OwnershipFixture fixture;
  fixture.chain->FailNextCalls(1);
  fixture.verifier->Verify("alice.near", "tok", fixture.Proof("tok", kNow));

  fixture.chain->SetUnreachable(true);
  const BindingProof proof = fixture.Proof("tok", kNow);
  ExpectRecoveryError([&]() { fixture.verifier->Verify("alice.near", "tok", proof); },
                      ErrorCode::kProviderUnreachable, "Chain outage must surface as ProviderUnreachable");
  fixture.chain->SetUnreachable(false);
  fixture.verifier->Verify("alice.near", "tok", proof);
}

mpcrec::Signature SignWithDealer(const mpcrec::DealerOutput& dealt, const Bytes& message) {
  // Two-party FROST over parties 1 and 2 of a 2-of-3 dealing.
  const std::vector<mpcrec::PartyIndex> signers = {1, 2};
  std::vector<mpcrec::SigningNonces> nonces;
  std::vector<mpcrec::SigningCommitment> commitments;
  for (mpcrec::PartyIndex id : signers) {
    nonces.push_back(mpcrec::GenerateNonces(dealt.shares[id - 1].share));
    commitments.push_back(mpcrec::CommitToNonces(id, nonces.back()));
  }
  const mpcrec::SigningPackage package(dealt.key_set.group_public_key, commitments, message);
  std::map<mpcrec::PartyIndex, Scalar> partials;
  for (size_t i = 0; i < signers.size(); ++i) {
    partials.emplace(signers[i],
                     mpcrec::SignShare(package, signers[i], dealt.shares[signers[i] - 1].share, nonces[i]));
  }
  return mpcrec::AggregateSignature(package, partials);
}

void TestChainKeyAdditionRequiresAuthorizedSigner() {
  const auto dealt = mpcrec::GenerateTrustedDealerKeys(3, 2);
  const ECPoint recovery_key = dealt.key_set.group_public_key;
  const ECPoint new_key = ECPoint::GeneratorMultiply(mpcrec::Csprng::RandomNonZeroScalar());
  InMemoryChain chain;
  chain.CreateAccount("alice.near", ECPoint::GeneratorMultiply(mpcrec::Csprng::RandomNonZeroScalar()));

  const Bytes payload = mpcrec::BuildKeyAdditionMessage(mpcrec::RequestKind::kRecoverAccount,
                                                        "alice.near", new_key, Bytes(16, 0x07));
  const mpcrec::Signature signature = SignWithDealer(dealt, payload);

  ExpectRecoveryError([&]() { chain.SubmitKeyAddition(payload, signature, recovery_key); },
                      ErrorCode::kUnauthorizedKey, "Signer not on the account must be rejected");

  chain.AddKey("alice.near", recovery_key);
  ExpectRecoveryError([&]() { chain.SubmitKeyAddition(Bytes(payload.begin(), payload.end() - 1), signature, recovery_key); },
                      ErrorCode::kInvalidRequest, "Truncated payload must be rejected");

  const Bytes add_method_payload = mpcrec::BuildKeyAdditionMessage(
      mpcrec::RequestKind::kAddRecoveryMethod, "alice.near", new_key, Bytes(16, 0x07));
  ExpectRecoveryError([&]() { chain.SubmitKeyAddition(add_method_payload, signature, recovery_key); },
                      ErrorCode::kInvalidRequest, "Attestations cannot be submitted as key additions");

  mpcrec::Signature forged = signature;
  forged.z = forged.z + Scalar::FromUint64(1);
  ExpectRecoveryError([&]() { chain.SubmitKeyAddition(payload, forged, recovery_key); },
                      ErrorCode::kInvalidSignature, "Forged signature must be rejected");

  chain.SubmitKeyAddition(payload, signature, recovery_key);
  Expect(chain.HasKey("alice.near", new_key), "Accepted key addition must authorize the new key");
  ExpectThrow([&]() { chain.CreateAccount("alice.near", new_key); }, "Duplicate account must be rejected");
}

}  // namespace

int main() {
  try {
    TestIdentityVerifierAcceptsValidToken();
    TestIdentityVerifierRejectsBadTokens();
    TestIdentityVerifierRetriesUnreachableProvider();
    TestBindingMessageLayout();
    TestReplayGuard();
    TestOwnershipVerifierAcceptsOnce();
    TestOwnershipVerifierRejectsExpiredAcceptedProof();
    TestOwnershipVerifierRejectsOversizedAccount();
    TestOwnershipVerifierRejections();
    TestOwnershipVerifierChainOutage();
    TestChainKeyAdditionRequiresAuthorizedSigner();
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  std::cout << "Verifier tests passed" << '\n';
  return 0;
}
