#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "mpcrec/net/envelope.hpp"

namespace mpcrec {

// Returns whether the envelope was accepted; replies go to the outbox.
using SessionHandler = std::function<bool(const Envelope& envelope, std::vector<Envelope>* outbox)>;

// Not thread-safe; the owning node serializes access.
class SessionRouter {
 public:
  explicit SessionRouter(PartyIndex self_id);

  void RegisterSession(const Bytes& session_id, SessionHandler handler);
  void UnregisterSession(const Bytes& session_id);
  bool HasSession(const Bytes& session_id) const;

  bool Route(const Envelope& envelope, std::vector<Envelope>* outbox);
  size_t rejected_count() const;

  static std::string SessionKey(const Bytes& session_id);

 private:
  PartyIndex self_id_;
  std::unordered_map<std::string, SessionHandler> handlers_;
  size_t rejected_count_ = 0;
};

}  // namespace mpcrec
