#pragma once

#include <chrono>
#include <string>

#include "mpcrec/common/bytes.hpp"
#include "mpcrec/common/errors.hpp"
#include "mpcrec/protocol/types.hpp"

namespace mpcrec {

constexpr size_t kMinSessionIdLen = 16;
constexpr size_t kMaxSessionIdLen = 32;

enum class SessionStatus {
  kCollecting = 0,
  kQuorumReached = 1,
  kFinalized = 2,
  kAborted = 3,
  kTimedOut = 4,
};

const char* SessionStatusName(SessionStatus status);

// Fixed lifetime: the deadline is creation + timeout and activity never
// extends it. Sessions are not resumable once terminal.
class Session {
 public:
  Session(Bytes session_id,
          PartyIndex self_id,
          std::chrono::milliseconds timeout,
          std::chrono::steady_clock::time_point created_at =
              std::chrono::steady_clock::now());
  virtual ~Session() = default;

  const Bytes& session_id() const;
  PartyIndex self_id() const;
  std::chrono::steady_clock::time_point deadline() const;

  SessionStatus status() const;
  bool IsTerminal() const;
  const std::string& abort_reason() const;
  // kQuorumTimeout after a time-out; meaningful only for kAborted/kTimedOut.
  ErrorCode error_code() const;

  bool PollTimeout(std::chrono::steady_clock::time_point now =
                       std::chrono::steady_clock::now());

 protected:
  bool ValidateSessionBinding(const Bytes& msg_session_id,
                              PartyIndex to,
                              std::string* error) const;

  void Abort(ErrorCode code, const std::string& reason);
  void MarkQuorumReached();
  void Finalize();

 private:
  Bytes session_id_;
  PartyIndex self_id_;
  std::chrono::steady_clock::time_point deadline_;

  SessionStatus status_ = SessionStatus::kCollecting;
  ErrorCode error_code_ = ErrorCode::kQuorumTimeout;
  std::string abort_reason_;
};

}  // namespace mpcrec
