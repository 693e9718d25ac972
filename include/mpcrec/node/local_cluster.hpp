#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "mpcrec/derivation/trusted_dealer.hpp"
#include "mpcrec/net/in_memory_transport.hpp"
#include "mpcrec/node/recovery_node.hpp"
#include "mpcrec/verify/chain.hpp"
#include "mpcrec/verify/identity_provider.hpp"

namespace mpcrec {

struct LocalClusterOptions {
  uint32_t n = 4;
  // 0 selects n - 1.
  uint32_t threshold = 0;
  std::vector<std::string> trusted_providers = {"google"};
  std::string audience = "mpcrec";
  std::chrono::milliseconds session_timeout = std::chrono::milliseconds(10000);
  RetryPolicy retry;
  size_t worker_count = 2;
  bool submit_to_chain = false;
};

// N nodes in one process: trusted-dealer shares, an in-memory network, one
// shared identity provider and chain, and a private registry per node.
class LocalCluster {
 public:
  explicit LocalCluster(LocalClusterOptions options = {});
  ~LocalCluster();

  LocalCluster(const LocalCluster&) = delete;
  LocalCluster& operator=(const LocalCluster&) = delete;

  RecoveryNode& node(PartyIndex party_id);
  std::vector<PartyIndex> party_ids() const;
  size_t size() const;

  const KeySet& key_set() const;
  InMemoryNetwork& network();
  StaticIdentityProvider& identity_provider();
  InMemoryChain& chain();

  void SetOnline(PartyIndex party_id, bool online);

  // Registers a valid token for `identity` with the shared provider.
  std::string IssueToken(const Identity& identity,
                         std::chrono::seconds lifetime = std::chrono::seconds(3600));

 private:
  LocalClusterOptions options_;
  KeySet key_set_;
  std::shared_ptr<InMemoryNetwork> network_;
  std::shared_ptr<StaticIdentityProvider> identity_provider_;
  std::shared_ptr<InMemoryChain> chain_;
  std::map<PartyIndex, std::unique_ptr<RecoveryNode>> nodes_;
  uint64_t token_counter_ = 0;
};

}  // namespace mpcrec
