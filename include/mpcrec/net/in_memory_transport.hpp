#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "mpcrec/net/transport.hpp"

namespace mpcrec {

class InMemoryTransport;

// Returns what the recipient actually receives for one delivery: nothing
// (drop), the envelope, several copies, or altered copies.
using EnvelopeInterceptor = std::function<std::vector<Envelope>(const Envelope& envelope)>;

// Process-local network. Every delivery goes through the wire codec; parties
// can be taken offline to simulate unreachable nodes.
class InMemoryNetwork : public std::enable_shared_from_this<InMemoryNetwork> {
 public:
  std::shared_ptr<InMemoryTransport> CreateEndpoint(PartyIndex self_id);

  void SetReachable(PartyIndex party_id, bool reachable);
  bool IsReachable(PartyIndex party_id) const;
  void SetInterceptor(EnvelopeInterceptor interceptor);

  size_t dropped_count() const;

 private:
  friend class InMemoryTransport;

  void Send(const Envelope& envelope, PartyIndex to);
  void Broadcast(const Envelope& envelope, PartyIndex from);
  void Unregister(PartyIndex self_id);
  void DeliverThroughWire(const std::shared_ptr<InMemoryTransport>& target,
                          const Envelope& envelope,
                          const EnvelopeInterceptor& interceptor);

  std::unordered_map<PartyIndex, std::weak_ptr<InMemoryTransport>> endpoints_;
  std::unordered_set<PartyIndex> offline_;
  EnvelopeInterceptor interceptor_;
  size_t dropped_count_ = 0;
  mutable std::mutex mu_;
};

class InMemoryTransport : public ITransport,
                          public std::enable_shared_from_this<InMemoryTransport> {
 public:
  InMemoryTransport(PartyIndex self_id, std::shared_ptr<InMemoryNetwork> network);
  ~InMemoryTransport() override;

  InMemoryTransport(const InMemoryTransport&) = delete;
  InMemoryTransport& operator=(const InMemoryTransport&) = delete;

  void Send(PartyIndex to, const Envelope& envelope) override;
  void Broadcast(const Envelope& envelope) override;
  void RegisterHandler(EnvelopeHandler handler) override;

  PartyIndex self_id() const;

 private:
  friend class InMemoryNetwork;
  void Deliver(const Envelope& envelope);

  PartyIndex self_id_;
  std::shared_ptr<InMemoryNetwork> network_;
  std::mutex mu_;
  EnvelopeHandler handler_;
};

}  // namespace mpcrec
