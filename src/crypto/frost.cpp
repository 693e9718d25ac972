#include "mpcrec/crypto/frost.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>
#include <utility>

#include "mpcrec/common/secure_zeroize.hpp"
#include "mpcrec/crypto/encoding.hpp"
#include "mpcrec/crypto/hash.hpp"
#include "mpcrec/crypto/random.hpp"

namespace mpcrec {
namespace {

constexpr char kContextString[] = "FROST-secp256k1-SHA256-v1";

std::string Dst(const char* suffix) {
  return std::string(kContextString) + suffix;
}

Scalar H1(std::span<const uint8_t> m) {
  return HashToScalar(m, Dst("rho"));
}

Scalar H2(std::span<const uint8_t> m) {
  return HashToScalar(m, Dst("chal"));
}

Scalar H3(std::span<const uint8_t> m) {
  return HashToScalar(m, Dst("nonce"));
}

Bytes PrefixedSha256(const char* tag, std::span<const uint8_t> m) {
  const std::string prefix = Dst(tag);
  Bytes input(prefix.begin(), prefix.end());
  input.insert(input.end(), m.begin(), m.end());
  return Sha256(input);
}

Bytes H4(std::span<const uint8_t> m) {
  return PrefixedSha256("msg", m);
}

Bytes H5(std::span<const uint8_t> m) {
  return PrefixedSha256("com", m);
}

void AppendScalar(const Scalar& scalar, Bytes* out) {
  const auto encoded = scalar.ToCanonicalBytes();
  out->insert(out->end(), encoded.begin(), encoded.end());
}

void AppendPoint(const ECPoint& point, Bytes* out) {
  const Bytes encoded = point.ToCompressedBytes();
  out->insert(out->end(), encoded.begin(), encoded.end());
}

Bytes EncodeGroupCommitmentList(const std::vector<SigningCommitment>& commitments) {
  Bytes out;
  out.reserve(commitments.size() * (kScalarLen + 2 * kPointCompressedLen));
  for (const SigningCommitment& commitment : commitments) {
    AppendScalar(Scalar::FromUint64(commitment.id), &out);
    AppendPoint(commitment.hiding, &out);
    AppendPoint(commitment.binding, &out);
  }
  return out;
}

Scalar NonceGenerate(const Scalar& secret) {
  Bytes input = Csprng::RandomBytes(32);
  AppendScalar(secret, &input);
  const Scalar nonce = H3(input);
  SecureZeroize(&input);
  return nonce;
}

Scalar ComputeChallenge(const ECPoint& group_commitment,
                        const ECPoint& group_public_key,
                        std::span<const uint8_t> message) {
  Bytes input;
  AppendPoint(group_commitment, &input);
  AppendPoint(group_public_key, &input);
  input.insert(input.end(), message.begin(), message.end());
  return H2(input);
}

void ValidateCommitmentOrder(const std::vector<SigningCommitment>& commitments) {
  if (commitments.empty()) {
    throw std::invalid_argument("signing package requires at least one commitment");
  }
  for (size_t i = 0; i < commitments.size(); ++i) {
    if (commitments[i].id == 0) {
      throw std::invalid_argument("signer id must be non-zero");
    }
    if (i > 0 && commitments[i - 1].id >= commitments[i].id) {
      throw std::invalid_argument("commitments must be sorted by id without repeats");
    }
  }
}

}  // namespace

Bytes EncodeSignature(const Signature& signature) {
  Bytes out;
  out.reserve(kSignatureLen);
  AppendPoint(signature.R, &out);
  AppendScalar(signature.z, &out);
  return out;
}

Signature DecodeSignature(std::span<const uint8_t> encoded) {
  if (encoded.size() != kSignatureLen) {
    throw std::invalid_argument("signature must be 65 bytes");
  }
  ByteReader reader(encoded);
  Signature out;
  out.R = reader.ReadPoint();
  out.z = reader.ReadScalar();
  return out;
}

SigningNonces GenerateNonces(const Scalar& secret_share) {
  SigningNonces out;
  do {
    out.hiding = NonceGenerate(secret_share);
  } while (out.hiding.IsZero());
  do {
    out.binding = NonceGenerate(secret_share);
  } while (out.binding.IsZero());
  return out;
}

SigningCommitment CommitToNonces(PartyIndex id, const SigningNonces& nonces) {
  SigningCommitment out;
  out.id = id;
  out.hiding = ECPoint::GeneratorMultiply(nonces.hiding);
  out.binding = ECPoint::GeneratorMultiply(nonces.binding);
  return out;
}

Scalar LagrangeCoefficientAtZero(PartyIndex id, std::span<const PartyIndex> participants) {
  if (id == 0) {
    throw std::invalid_argument("lagrange id must be non-zero");
  }

  bool found = false;
  Scalar numerator = Scalar::FromUint64(1);
  Scalar denominator = Scalar::FromUint64(1);
  const Scalar x_i = Scalar::FromUint64(id);
  for (PartyIndex j : participants) {
    if (j == id) {
      if (found) {
        throw std::invalid_argument("lagrange participants must be unique");
      }
      found = true;
      continue;
    }
    const Scalar x_j = Scalar::FromUint64(j);
    numerator = numerator * x_j;
    denominator = denominator * (x_j - x_i);
  }
  if (!found) {
    throw std::invalid_argument("lagrange id is not among the participants");
  }
  return numerator * denominator.Inverse();
}

SigningPackage::SigningPackage(ECPoint group_public_key,
                               std::vector<SigningCommitment> commitments,
                               Bytes message)
    : group_public_key_(std::move(group_public_key)),
      commitments_(std::move(commitments)),
      message_(std::move(message)) {
  ValidateCommitmentOrder(commitments_);
  signers_.reserve(commitments_.size());
  for (const SigningCommitment& commitment : commitments_) {
    signers_.push_back(commitment.id);
  }

  Bytes rho_input_prefix;
  AppendPoint(group_public_key_, &rho_input_prefix);
  const Bytes msg_hash = H4(message_);
  rho_input_prefix.insert(rho_input_prefix.end(), msg_hash.begin(), msg_hash.end());
  const Bytes commitment_hash = H5(EncodeGroupCommitmentList(commitments_));
  rho_input_prefix.insert(rho_input_prefix.end(), commitment_hash.begin(), commitment_hash.end());

  std::vector<ECPoint> terms;
  terms.reserve(commitments_.size() * 2);
  for (const SigningCommitment& commitment : commitments_) {
    Bytes rho_input = rho_input_prefix;
    AppendScalar(Scalar::FromUint64(commitment.id), &rho_input);
    const Scalar rho = H1(rho_input);
    binding_factors_.emplace(commitment.id, rho);

    terms.push_back(commitment.hiding);
    terms.push_back(commitment.binding.Mul(rho));
  }
  group_commitment_ = ECPoint::Sum(terms);
  challenge_ = ComputeChallenge(group_commitment_, group_public_key_, message_);
}

const ECPoint& SigningPackage::group_public_key() const {
  return group_public_key_;
}

const Bytes& SigningPackage::message() const {
  return message_;
}

const std::vector<SigningCommitment>& SigningPackage::commitments() const {
  return commitments_;
}

const std::vector<PartyIndex>& SigningPackage::signers() const {
  return signers_;
}

bool SigningPackage::Contains(PartyIndex id) const {
  return binding_factors_.contains(id);
}

const SigningCommitment& SigningPackage::CommitmentFor(PartyIndex id) const {
  const auto it = std::lower_bound(
      commitments_.begin(), commitments_.end(), id,
      [](const SigningCommitment& commitment, PartyIndex value) { return commitment.id < value; });
  if (it == commitments_.end() || it->id != id) {
    throw std::invalid_argument("party is not part of the signing package");
  }
  return *it;
}

const Scalar& SigningPackage::BindingFactorFor(PartyIndex id) const {
  const auto it = binding_factors_.find(id);
  if (it == binding_factors_.end()) {
    throw std::invalid_argument("party is not part of the signing package");
  }
  return it->second;
}

Scalar SigningPackage::LagrangeFor(PartyIndex id) const {
  return LagrangeCoefficientAtZero(id, signers_);
}

const ECPoint& SigningPackage::group_commitment() const {
  return group_commitment_;
}

const Scalar& SigningPackage::challenge() const {
  return challenge_;
}

Scalar SignShare(const SigningPackage& package,
                 PartyIndex id,
                 const Scalar& secret_share,
                 const SigningNonces& nonces) {
  const Scalar& rho = package.BindingFactorFor(id);
  const Scalar lambda = package.LagrangeFor(id);
  return nonces.hiding + nonces.binding * rho + lambda * secret_share * package.challenge();
}

bool VerifySignatureShare(const SigningPackage& package,
                          PartyIndex id,
                          const ECPoint& verification_share,
                          const Scalar& share) {
  if (!package.Contains(id) || share.IsZero()) {
    return false;
  }

  try {
    const SigningCommitment& commitment = package.CommitmentFor(id);
    const Scalar& rho = package.BindingFactorFor(id);
    const Scalar lambda = package.LagrangeFor(id);

    const ECPoint lhs = ECPoint::GeneratorMultiply(share);
    const std::array<ECPoint, 3> terms = {
        commitment.hiding,
        commitment.binding.Mul(rho),
        verification_share.Mul(package.challenge() * lambda),
    };
    return lhs == ECPoint::Sum(terms);
  } catch (const std::invalid_argument&) {
    return false;
  }
}

Signature AggregateSignature(const SigningPackage& package,
                             const std::map<PartyIndex, Scalar>& shares) {
  if (shares.size() != package.signers().size()) {
    throw std::invalid_argument("aggregation requires exactly one share per signer");
  }

  Scalar z;
  for (PartyIndex id : package.signers()) {
    const auto it = shares.find(id);
    if (it == shares.end()) {
      throw std::invalid_argument("missing signature share for signer " + std::to_string(id));
    }
    z = z + it->second;
  }

  Signature out;
  out.R = package.group_commitment();
  out.z = z;
  return out;
}

bool VerifySignature(const ECPoint& public_key,
                     std::span<const uint8_t> message,
                     const Signature& signature) {
  if (signature.z.IsZero()) {
    return false;
  }

  try {
    const Scalar c = ComputeChallenge(signature.R, public_key, message);
    const ECPoint lhs = ECPoint::GeneratorMultiply(signature.z);
    const ECPoint rhs = signature.R.Add(public_key.Mul(c));
    return lhs == rhs;
  } catch (const std::invalid_argument&) {
    return false;
  }
}

}  // namespace mpcrec
