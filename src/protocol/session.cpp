#include "mpcrec/protocol/session.hpp"

#include <stdexcept>
#include <utility>

#include "mpcrec/net/envelope.hpp"

namespace mpcrec {

const char* SessionStatusName(SessionStatus status) {
  switch (status) {
    case SessionStatus::kCollecting:
      return "Collecting";
    case SessionStatus::kQuorumReached:
      return "QuorumReached";
    case SessionStatus::kFinalized:
      return "Finalized";
    case SessionStatus::kAborted:
      return "Aborted";
    case SessionStatus::kTimedOut:
      return "TimedOut";
  }
  return "Unknown";
}

Session::Session(Bytes session_id,
                 PartyIndex self_id,
                 std::chrono::milliseconds timeout,
                 std::chrono::steady_clock::time_point created_at)
    : session_id_(std::move(session_id)),
      self_id_(self_id),
      deadline_(created_at + timeout) {
  if (session_id_.size() < kMinSessionIdLen || session_id_.size() > kMaxSessionIdLen) {
    throw std::invalid_argument("session id must be 16..32 bytes");
  }
  if (self_id_ == 0) {
    throw std::invalid_argument("self_id must be non-zero");
  }
  if (timeout.count() <= 0) {
    throw std::invalid_argument("timeout must be positive");
  }
}

const Bytes& Session::session_id() const {
  return session_id_;
}

PartyIndex Session::self_id() const {
  return self_id_;
}

std::chrono::steady_clock::time_point Session::deadline() const {
  return deadline_;
}

SessionStatus Session::status() const {
  return status_;
}

bool Session::IsTerminal() const {
  return status_ == SessionStatus::kFinalized ||
         status_ == SessionStatus::kAborted ||
         status_ == SessionStatus::kTimedOut;
}

const std::string& Session::abort_reason() const {
  return abort_reason_;
}

ErrorCode Session::error_code() const {
  return error_code_;
}

bool Session::PollTimeout(std::chrono::steady_clock::time_point now) {
  if (IsTerminal()) {
    return status_ == SessionStatus::kTimedOut;
  }

  if (now >= deadline_) {
    status_ = SessionStatus::kTimedOut;
    error_code_ = ErrorCode::kQuorumTimeout;
    abort_reason_ = "session timed out before quorum";
    return true;
  }
  return false;
}

bool Session::ValidateSessionBinding(const Bytes& msg_session_id,
                                     PartyIndex to,
                                     std::string* error) const {
  if (msg_session_id != session_id_) {
    if (error != nullptr) {
      *error = "session_id mismatch";
    }
    return false;
  }

  if (to != self_id_ && to != kBroadcastPartyId) {
    if (error != nullptr) {
      *error = "message recipient mismatch";
    }
    return false;
  }

  return true;
}

void Session::Abort(ErrorCode code, const std::string& reason) {
  if (IsTerminal()) {
    return;
  }
  status_ = SessionStatus::kAborted;
  error_code_ = code;
  abort_reason_ = reason;
}

void Session::MarkQuorumReached() {
  if (status_ != SessionStatus::kCollecting) {
    throw std::logic_error("quorum can only be reached from Collecting");
  }
  status_ = SessionStatus::kQuorumReached;
}

void Session::Finalize() {
  if (status_ != SessionStatus::kQuorumReached) {
    throw std::logic_error("session can only finalize after quorum");
  }
  status_ = SessionStatus::kFinalized;
  abort_reason_.clear();
}

}  // namespace mpcrec
