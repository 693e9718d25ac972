#include "mpcrec/protocol/messages.hpp"

#include <stdexcept>
#include <utility>

#include "mpcrec/crypto/ecdsa.hpp"
#include "mpcrec/crypto/encoding.hpp"
#include "mpcrec/verify/identity_verifier.hpp"

namespace mpcrec {
namespace {

constexpr char kKeyAdditionDomain[] = "mpcrec/add-key/v1";
constexpr size_t kMaxAbortReasonLen = 1024;
constexpr size_t kMaxPackageMembers = 1024;
constexpr size_t kMaxSessionIdBytes = 32;

constexpr uint8_t kFieldAbsent = 0;
constexpr uint8_t kFieldPresent = 1;

RequestKind ParseRequestKind(uint8_t raw) {
  switch (raw) {
    case static_cast<uint8_t>(RequestKind::kAddRecoveryMethod):
      return RequestKind::kAddRecoveryMethod;
    case static_cast<uint8_t>(RequestKind::kRecoverAccount):
      return RequestKind::kRecoverAccount;
    default:
      throw std::invalid_argument("unknown request kind");
  }
}

uint8_t ReadPresence(ByteReader* reader) {
  const uint8_t flag = reader->ReadU8();
  if (flag != kFieldAbsent && flag != kFieldPresent) {
    throw std::invalid_argument("invalid optional field marker");
  }
  return flag;
}

}  // namespace

const char* MessageTypeName(uint32_t type) {
  switch (static_cast<RecoveryMessageType>(type)) {
    case RecoveryMessageType::kSignRequest:
      return "SignRequest";
    case RecoveryMessageType::kCommitRequest:
      return "CommitRequest";
    case RecoveryMessageType::kCommitment:
      return "Commitment";
    case RecoveryMessageType::kSignPackage:
      return "SignPackage";
    case RecoveryMessageType::kPartial:
      return "Partial";
    case RecoveryMessageType::kAbort:
      return "Abort";
  }
  return "Unknown";
}

void ValidateSigningRequest(const SigningRequest& request) {
  if (request.account_id.empty() || request.account_id.size() > kMaxAccountIdLen) {
    throw std::invalid_argument("account_id must be 1..256 bytes");
  }
  if (request.access_token.empty() || request.access_token.size() > kMaxAccessTokenLen) {
    throw std::invalid_argument("access_token must be 1..8192 bytes");
  }
  switch (request.kind) {
    case RequestKind::kAddRecoveryMethod:
      if (!request.proof.has_value() || request.new_public_key.has_value()) {
        throw std::invalid_argument("add-method request carries exactly a binding proof");
      }
      if (request.proof->signature.size() != kEcdsaCompactSignatureLen) {
        throw std::invalid_argument("binding signature must be 64 bytes");
      }
      if (request.proof->nonce.size() < kMinBindingNonceLen ||
          request.proof->nonce.size() > kMaxBindingNonceLen) {
        throw std::invalid_argument("binding nonce must be 16..64 bytes");
      }
      return;
    case RequestKind::kRecoverAccount:
      if (request.proof.has_value() || !request.new_public_key.has_value()) {
        throw std::invalid_argument("recover request carries exactly a new public key");
      }
      return;
  }
  throw std::invalid_argument("unknown request kind");
}

Bytes EncodeSigningRequest(const SigningRequest& request) {
  ValidateSigningRequest(request);

  ByteWriter writer;
  writer.WriteU8(static_cast<uint8_t>(request.kind));
  writer.WriteString(request.account_id);
  writer.WriteString(request.access_token);
  if (request.proof.has_value()) {
    writer.WriteU8(kFieldPresent);
    writer.WriteSized(request.proof->signature);
    writer.WritePoint(request.proof->signer_public_key);
    writer.WriteSized(request.proof->nonce);
    writer.WriteU64(request.proof->timestamp);
  } else {
    writer.WriteU8(kFieldAbsent);
  }
  if (request.new_public_key.has_value()) {
    writer.WriteU8(kFieldPresent);
    writer.WritePoint(*request.new_public_key);
  } else {
    writer.WriteU8(kFieldAbsent);
  }
  return writer.Take();
}

SigningRequest DecodeSigningRequest(std::span<const uint8_t> payload) {
  ByteReader reader(payload);

  SigningRequest out;
  out.kind = ParseRequestKind(reader.ReadU8());
  out.account_id = reader.ReadString(kMaxAccountIdLen, "account_id");
  out.access_token = reader.ReadString(kMaxAccessTokenLen, "access_token");
  if (ReadPresence(&reader) == kFieldPresent) {
    BindingProof proof;
    proof.signature = reader.ReadSized(kEcdsaCompactSignatureLen, "binding signature");
    proof.signer_public_key = reader.ReadPoint();
    proof.nonce = reader.ReadSized(kMaxBindingNonceLen, "binding nonce");
    proof.timestamp = reader.ReadU64();
    out.proof = std::move(proof);
  }
  if (ReadPresence(&reader) == kFieldPresent) {
    out.new_public_key = reader.ReadPoint();
  }
  reader.ExpectEnd("SigningRequest");

  ValidateSigningRequest(out);
  return out;
}

Bytes EncodeCommitRequest(const CommitRequestMessage& message) {
  ByteWriter writer;
  writer.WriteU32(message.attempt);
  return writer.Take();
}

CommitRequestMessage DecodeCommitRequest(std::span<const uint8_t> payload) {
  ByteReader reader(payload);
  CommitRequestMessage out;
  out.attempt = reader.ReadU32();
  reader.ExpectEnd("CommitRequest");
  return out;
}

Bytes EncodeCommitment(const CommitmentMessage& message) {
  ByteWriter writer;
  writer.WriteU32(message.attempt);
  writer.WritePoint(message.hiding);
  writer.WritePoint(message.binding);
  return writer.Take();
}

CommitmentMessage DecodeCommitment(std::span<const uint8_t> payload) {
  ByteReader reader(payload);
  CommitmentMessage out;
  out.attempt = reader.ReadU32();
  out.hiding = reader.ReadPoint();
  out.binding = reader.ReadPoint();
  reader.ExpectEnd("Commitment");
  return out;
}

Bytes EncodeSignPackage(const SignPackageMessage& message) {
  if (message.commitments.size() > kMaxPackageMembers) {
    throw std::invalid_argument("sign package has too many members");
  }

  ByteWriter writer;
  writer.WriteU32(message.attempt);
  writer.WriteU32(static_cast<uint32_t>(message.commitments.size()));
  for (const SigningCommitment& commitment : message.commitments) {
    writer.WriteU32(commitment.id);
    writer.WritePoint(commitment.hiding);
    writer.WritePoint(commitment.binding);
  }
  return writer.Take();
}

SignPackageMessage DecodeSignPackage(std::span<const uint8_t> payload) {
  ByteReader reader(payload);
  SignPackageMessage out;
  out.attempt = reader.ReadU32();
  const uint32_t count = reader.ReadU32();
  if (count == 0 || count > kMaxPackageMembers) {
    throw std::invalid_argument("sign package member count out of range");
  }
  out.commitments.reserve(count);
  for (uint32_t i = 0; i < count; ++i) {
    SigningCommitment commitment;
    commitment.id = reader.ReadU32();
    commitment.hiding = reader.ReadPoint();
    commitment.binding = reader.ReadPoint();
    out.commitments.push_back(std::move(commitment));
  }
  reader.ExpectEnd("SignPackage");
  return out;
}

Bytes EncodePartial(const PartialMessage& message) {
  ByteWriter writer;
  writer.WriteU32(message.attempt);
  writer.WriteScalar(message.share);
  return writer.Take();
}

PartialMessage DecodePartial(std::span<const uint8_t> payload) {
  ByteReader reader(payload);
  PartialMessage out;
  out.attempt = reader.ReadU32();
  out.share = reader.ReadScalar();
  reader.ExpectEnd("Partial");
  return out;
}

Bytes EncodeAbort(const AbortMessage& message) {
  ByteWriter writer;
  writer.WriteU32(static_cast<uint32_t>(message.code));
  writer.WriteString(message.reason.size() > kMaxAbortReasonLen
                         ? std::string_view(message.reason).substr(0, kMaxAbortReasonLen)
                         : std::string_view(message.reason));
  return writer.Take();
}

AbortMessage DecodeAbort(std::span<const uint8_t> payload) {
  ByteReader reader(payload);
  AbortMessage out;
  out.code = ErrorCodeFromWire(reader.ReadU32());
  out.reason = reader.ReadString(kMaxAbortReasonLen, "abort reason");
  reader.ExpectEnd("Abort");
  return out;
}

Bytes BuildKeyAdditionMessage(RequestKind kind,
                              std::string_view account_id,
                              const ECPoint& public_key,
                              std::span<const uint8_t> session_id) {
  if (account_id.empty()) {
    throw std::invalid_argument("key addition requires an account id");
  }
  if (session_id.empty()) {
    throw std::invalid_argument("key addition requires a session nonce");
  }

  ByteWriter writer;
  writer.WriteString(kKeyAdditionDomain);
  writer.WriteU8(static_cast<uint8_t>(kind));
  writer.WriteString(account_id);
  writer.WritePoint(public_key);
  writer.WriteSized(session_id);
  return writer.Take();
}

KeyAddition ParseKeyAdditionMessage(std::span<const uint8_t> message) {
  ByteReader reader(message);
  if (reader.ReadString(sizeof(kKeyAdditionDomain), "domain") != kKeyAdditionDomain) {
    throw std::invalid_argument("not a key addition payload");
  }

  KeyAddition out;
  out.kind = ParseRequestKind(reader.ReadU8());
  out.account_id = reader.ReadString(kMaxAccountIdLen, "account_id");
  out.public_key = reader.ReadPoint();
  out.session_id = reader.ReadSized(kMaxSessionIdBytes, "session_id");
  reader.ExpectEnd("KeyAddition");
  if (out.account_id.empty() || out.session_id.empty()) {
    throw std::invalid_argument("key addition payload has empty fields");
  }
  return out;
}

}  // namespace mpcrec
