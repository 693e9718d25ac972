#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "mpcrec/common/bytes.hpp"
#include "mpcrec/common/errors.hpp"
#include "mpcrec/crypto/ec_point.hpp"
#include "mpcrec/crypto/frost.hpp"
#include "mpcrec/crypto/scalar.hpp"
#include "mpcrec/protocol/types.hpp"
#include "mpcrec/verify/binding_message.hpp"

namespace mpcrec {

enum class RecoveryMessageType : uint32_t {
  kSignRequest = 3001,
  kCommitRequest = 3002,
  kCommitment = 3003,
  kSignPackage = 3004,
  kPartial = 3005,
  kAbort = 3099,
};

constexpr uint32_t MessageTypeValue(RecoveryMessageType type) {
  return static_cast<uint32_t>(type);
}

const char* MessageTypeName(uint32_t type);

enum class RequestKind : uint8_t {
  kAddRecoveryMethod = 1,
  kRecoverAccount = 2,
};

// Everything a peer needs to re-run every check itself. The bytes to sign are
// never shipped: each node rebuilds them from these fields and the session id.
struct SigningRequest {
  RequestKind kind = RequestKind::kAddRecoveryMethod;
  std::string account_id;
  std::string access_token;
  std::optional<BindingProof> proof;        // add-method only
  std::optional<ECPoint> new_public_key;    // recover only
};

struct CommitRequestMessage {
  uint32_t attempt = 0;
};

struct CommitmentMessage {
  uint32_t attempt = 0;
  ECPoint hiding;
  ECPoint binding;
};

struct SignPackageMessage {
  uint32_t attempt = 0;
  std::vector<SigningCommitment> commitments;
};

struct PartialMessage {
  uint32_t attempt = 0;
  Scalar share;
};

struct AbortMessage {
  ErrorCode code = ErrorCode::kInvalidRequest;
  std::string reason;
};

// Throws std::invalid_argument when the request is structurally unusable.
void ValidateSigningRequest(const SigningRequest& request);

Bytes EncodeSigningRequest(const SigningRequest& request);
SigningRequest DecodeSigningRequest(std::span<const uint8_t> payload);

Bytes EncodeCommitRequest(const CommitRequestMessage& message);
CommitRequestMessage DecodeCommitRequest(std::span<const uint8_t> payload);

Bytes EncodeCommitment(const CommitmentMessage& message);
CommitmentMessage DecodeCommitment(std::span<const uint8_t> payload);

Bytes EncodeSignPackage(const SignPackageMessage& message);
SignPackageMessage DecodeSignPackage(std::span<const uint8_t> payload);

Bytes EncodePartial(const PartialMessage& message);
PartialMessage DecodePartial(std::span<const uint8_t> payload);

Bytes EncodeAbort(const AbortMessage& message);
AbortMessage DecodeAbort(std::span<const uint8_t> payload);

// Payload the network co-signs: "mpcrec/add-key/v1", kind, account, key and
// the session nonce, each length-prefixed. The nonce keeps signatures from
// unrelated requests apart.
Bytes BuildKeyAdditionMessage(RequestKind kind,
                              std::string_view account_id,
                              const ECPoint& public_key,
                              std::span<const uint8_t> session_id);

struct KeyAddition {
  RequestKind kind = RequestKind::kRecoverAccount;
  std::string account_id;
  ECPoint public_key;
  Bytes session_id;
};

KeyAddition ParseKeyAdditionMessage(std::span<const uint8_t> message);

}  // namespace mpcrec
