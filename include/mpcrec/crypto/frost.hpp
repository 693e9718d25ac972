#pragma once

#include <cstddef>
#include <map>
#include <span>
#include <unordered_map>
#include <vector>

#include "mpcrec/common/bytes.hpp"
#include "mpcrec/crypto/ec_point.hpp"
#include "mpcrec/crypto/scalar.hpp"
#include "mpcrec/protocol/types.hpp"

namespace mpcrec {

// FROST(secp256k1, SHA-256), RFC 9591.

struct SigningNonces {
  Scalar hiding;
  Scalar binding;
};

struct SigningCommitment {
  PartyIndex id = 0;
  ECPoint hiding;
  ECPoint binding;

  bool operator==(const SigningCommitment& other) const = default;
};

struct Signature {
  ECPoint R;
  Scalar z;
};

constexpr size_t kSignatureLen = 65;

Bytes EncodeSignature(const Signature& signature);
Signature DecodeSignature(std::span<const uint8_t> encoded);

SigningNonces GenerateNonces(const Scalar& secret_share);
SigningCommitment CommitToNonces(PartyIndex id, const SigningNonces& nonces);

Scalar LagrangeCoefficientAtZero(PartyIndex id, std::span<const PartyIndex> participants);

// Commitment list plus everything derived from it (binding factors, group
// commitment, challenge). Commitments must be sorted by id without repeats.
class SigningPackage {
 public:
  SigningPackage(ECPoint group_public_key,
                 std::vector<SigningCommitment> commitments,
                 Bytes message);

  const ECPoint& group_public_key() const;
  const Bytes& message() const;
  const std::vector<SigningCommitment>& commitments() const;
  const std::vector<PartyIndex>& signers() const;
  bool Contains(PartyIndex id) const;
  const SigningCommitment& CommitmentFor(PartyIndex id) const;
  const Scalar& BindingFactorFor(PartyIndex id) const;
  Scalar LagrangeFor(PartyIndex id) const;
  const ECPoint& group_commitment() const;
  const Scalar& challenge() const;

 private:
  ECPoint group_public_key_;
  std::vector<SigningCommitment> commitments_;
  std::vector<PartyIndex> signers_;
  Bytes message_;
  std::unordered_map<PartyIndex, Scalar> binding_factors_;
  ECPoint group_commitment_;
  Scalar challenge_;
};

Scalar SignShare(const SigningPackage& package,
                 PartyIndex id,
                 const Scalar& secret_share,
                 const SigningNonces& nonces);

bool VerifySignatureShare(const SigningPackage& package,
                          PartyIndex id,
                          const ECPoint& verification_share,
                          const Scalar& share);

Signature AggregateSignature(const SigningPackage& package,
                             const std::map<PartyIndex, Scalar>& shares);

bool VerifySignature(const ECPoint& public_key,
                     std::span<const uint8_t> message,
                     const Signature& signature);

}  // namespace mpcrec
