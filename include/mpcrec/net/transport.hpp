#pragma once

#include <functional>

#include "mpcrec/net/envelope.hpp"

namespace mpcrec {

using EnvelopeHandler = std::function<void(const Envelope& envelope)>;

class ITransport {
 public:
  virtual ~ITransport() = default;

  // Throws RecoveryError(kNodeUnreachable) when the peer cannot be reached.
  virtual void Send(PartyIndex to, const Envelope& envelope) = 0;
  // Best effort; unreachable peers simply miss the message.
  virtual void Broadcast(const Envelope& envelope) = 0;

  virtual void RegisterHandler(EnvelopeHandler handler) = 0;
};

}  // namespace mpcrec
