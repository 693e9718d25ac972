#include "mpcrec/node/local_cluster.hpp"

#include <stdexcept>
#include <utility>

#include "mpcrec/common/clock.hpp"
#include "mpcrec/crypto/encoding.hpp"
#include "mpcrec/crypto/random.hpp"

namespace mpcrec {

LocalCluster::LocalCluster(LocalClusterOptions options)
    : options_(std::move(options)),
      network_(std::make_shared<InMemoryNetwork>()),
      identity_provider_(std::make_shared<StaticIdentityProvider>()),
      chain_(std::make_shared<InMemoryChain>()) {
  const uint32_t threshold = options_.threshold == 0 ? options_.n - 1 : options_.threshold;
  DealerOutput dealt = GenerateTrustedDealerKeys(options_.n, threshold);
  key_set_ = dealt.key_set;

  for (const NodeSecretShare& share : dealt.shares) {
    NodeConfig config;
    config.self_id = share.party_id;
    config.key_set = key_set_;
    config.trusted_providers = options_.trusted_providers;
    config.audience = options_.audience;
    config.session_timeout = options_.session_timeout;
    config.retry = options_.retry;
    config.worker_count = options_.worker_count;

    NodeDependencies deps;
    deps.transport = network_->CreateEndpoint(share.party_id);
    deps.identity_provider = identity_provider_;
    deps.chain = chain_;
    if (options_.submit_to_chain) {
      deps.submitter = chain_;
    }

    auto node = std::make_unique<RecoveryNode>(std::move(config), share, std::move(deps));
    node->Start();
    nodes_.emplace(share.party_id, std::move(node));
  }
}

LocalCluster::~LocalCluster() {
  for (auto& [id, node] : nodes_) {
    (void)id;
    node->Shutdown();
  }
  nodes_.clear();
}

RecoveryNode& LocalCluster::node(PartyIndex party_id) {
  const auto it = nodes_.find(party_id);
  if (it == nodes_.end()) {
    throw std::invalid_argument("no node with party id " + std::to_string(party_id));
  }
  return *it->second;
}

std::vector<PartyIndex> LocalCluster::party_ids() const {
  return key_set_.participants();
}

size_t LocalCluster::size() const {
  return nodes_.size();
}

const KeySet& LocalCluster::key_set() const {
  return key_set_;
}

InMemoryNetwork& LocalCluster::network() {
  return *network_;
}

StaticIdentityProvider& LocalCluster::identity_provider() {
  return *identity_provider_;
}

InMemoryChain& LocalCluster::chain() {
  return *chain_;
}

void LocalCluster::SetOnline(PartyIndex party_id, bool online) {
  network_->SetReachable(party_id, online);
}

std::string LocalCluster::IssueToken(const Identity& identity, std::chrono::seconds lifetime) {
  ValidateIdentity(identity);
  const uint64_t now = ToUnixSeconds(std::chrono::system_clock::now());

  TokenClaims claims;
  claims.issuer = identity.provider;
  claims.subject = identity.subject;
  claims.audience = options_.audience;
  claims.issued_at = now;
  claims.expires_at = now + static_cast<uint64_t>(lifetime.count());

  std::string token = "tok-" + std::to_string(++token_counter_) + "-" + ToHex(Csprng::RandomBytes(16));
  identity_provider_->Issue(token, claims);
  return token;
}

}  // namespace mpcrec
