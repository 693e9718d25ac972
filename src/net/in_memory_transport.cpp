#include "mpcrec/net/in_memory_transport.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "mpcrec/common/errors.hpp"
#include "mpcrec/common/logging.hpp"

namespace mpcrec {

std::shared_ptr<InMemoryTransport> InMemoryNetwork::CreateEndpoint(PartyIndex self_id) {
  if (self_id == 0) {
    throw std::invalid_argument("InMemory endpoint self_id must be non-zero");
  }

  auto endpoint = std::make_shared<InMemoryTransport>(self_id, shared_from_this());

  std::lock_guard<std::mutex> lock(mu_);
  if (const auto it = endpoints_.find(self_id); it != endpoints_.end() && !it->second.expired()) {
    throw std::invalid_argument("InMemory endpoint already registered for party " +
                                std::to_string(self_id));
  }
  endpoints_[self_id] = endpoint;
  return endpoint;
}

void InMemoryNetwork::SetReachable(PartyIndex party_id, bool reachable) {
  std::lock_guard<std::mutex> lock(mu_);
  if (reachable) {
    offline_.erase(party_id);
  } else {
    offline_.insert(party_id);
  }
}

bool InMemoryNetwork::IsReachable(PartyIndex party_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  return !offline_.contains(party_id);
}

void InMemoryNetwork::SetInterceptor(EnvelopeInterceptor interceptor) {
  std::lock_guard<std::mutex> lock(mu_);
  interceptor_ = std::move(interceptor);
}

size_t InMemoryNetwork::dropped_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return dropped_count_;
}

void InMemoryNetwork::Send(const Envelope& envelope, PartyIndex to) {
  std::shared_ptr<InMemoryTransport> target;
  EnvelopeInterceptor interceptor;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (offline_.contains(envelope.from) || offline_.contains(to)) {
      ++dropped_count_;
      throw RecoveryError(ErrorCode::kNodeUnreachable,
                          "party " + std::to_string(to) + " is unreachable");
    }
    const auto it = endpoints_.find(to);
    if (it == endpoints_.end()) {
      throw RecoveryError(ErrorCode::kNodeUnreachable,
                          "party " + std::to_string(to) + " is not connected");
    }
    target = it->second.lock();
    if (!target) {
      endpoints_.erase(it);
      throw RecoveryError(ErrorCode::kNodeUnreachable,
                          "party " + std::to_string(to) + " has disconnected");
    }
    interceptor = interceptor_;
  }

  DeliverThroughWire(target, envelope, interceptor);
}

void InMemoryNetwork::Broadcast(const Envelope& envelope, PartyIndex from) {
  std::vector<std::shared_ptr<InMemoryTransport>> targets;
  EnvelopeInterceptor interceptor;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (offline_.contains(from)) {
      ++dropped_count_;
      return;
    }
    for (auto it = endpoints_.begin(); it != endpoints_.end();) {
      auto endpoint = it->second.lock();
      if (!endpoint) {
        it = endpoints_.erase(it);
        continue;
      }

      if (it->first != from) {
        if (offline_.contains(it->first)) {
          ++dropped_count_;
        } else {
          targets.push_back(std::move(endpoint));
        }
      }
      ++it;
    }
    interceptor = interceptor_;
  }

  for (const auto& target : targets) {
    DeliverThroughWire(target, envelope, interceptor);
  }
}

void InMemoryNetwork::Unregister(PartyIndex self_id) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = endpoints_.find(self_id);
  if (it != endpoints_.end() && it->second.expired()) {
    endpoints_.erase(it);
  }
}

void InMemoryNetwork::DeliverThroughWire(const std::shared_ptr<InMemoryTransport>& target,
                                         const Envelope& envelope,
                                         const EnvelopeInterceptor& interceptor) {
  std::vector<Envelope> deliveries;
  if (interceptor) {
    deliveries = interceptor(envelope);
  } else {
    deliveries.push_back(envelope);
  }

  for (const Envelope& delivery : deliveries) {
    const Bytes wire = EncodeEnvelope(delivery);
    try {
      target->Deliver(DecodeEnvelope(wire));
    } catch (const std::invalid_argument& ex) {
      Log()->warn("dropping malformed envelope for party {}: {}", target->self_id(), ex.what());
    }
  }
}

InMemoryTransport::InMemoryTransport(PartyIndex self_id,
                                     std::shared_ptr<InMemoryNetwork> network)
    : self_id_(self_id), network_(std::move(network)) {
  if (self_id_ == 0) {
    throw std::invalid_argument("InMemoryTransport self_id must be non-zero");
  }
  if (!network_) {
    throw std::invalid_argument("InMemoryTransport requires a network");
  }
}

InMemoryTransport::~InMemoryTransport() {
  if (network_) {
    network_->Unregister(self_id_);
  }
}

void InMemoryTransport::Send(PartyIndex to, const Envelope& envelope) {
  if (envelope.from != self_id_) {
    throw std::invalid_argument("Envelope.from must match transport self_id");
  }

  Envelope outbound = envelope;
  outbound.to = to;
  network_->Send(outbound, to);
}

void InMemoryTransport::Broadcast(const Envelope& envelope) {
  if (envelope.from != self_id_) {
    throw std::invalid_argument("Envelope.from must match transport self_id");
  }

  Envelope outbound = envelope;
  outbound.to = kBroadcastPartyId;
  network_->Broadcast(outbound, self_id_);
}

void InMemoryTransport::RegisterHandler(EnvelopeHandler handler) {
  std::lock_guard<std::mutex> lock(mu_);
  handler_ = std::move(handler);
}

PartyIndex InMemoryTransport::self_id() const {
  return self_id_;
}

void InMemoryTransport::Deliver(const Envelope& envelope) {
  EnvelopeHandler handler;
  {
    std::lock_guard<std::mutex> lock(mu_);
    handler = handler_;
  }

  if (handler) {
    handler(envelope);
  }
}

}  // namespace mpcrec
