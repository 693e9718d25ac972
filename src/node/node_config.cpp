#include "mpcrec/node/node_config.hpp"

#include <stdexcept>

namespace mpcrec {

void ValidateNodeConfig(const NodeConfig& config) {
  if (config.self_id == 0) {
    throw std::invalid_argument("node self_id must be non-zero");
  }
  ValidateKeySet(config.key_set);
  if (!config.key_set.Contains(config.self_id)) {
    throw std::invalid_argument("node self_id is not in the key set");
  }
  if (config.trusted_providers.empty()) {
    throw std::invalid_argument("node requires at least one trusted provider");
  }
  if (config.audience.empty()) {
    throw std::invalid_argument("node audience must not be empty");
  }
  if (config.freshness_window.count() <= 0) {
    throw std::invalid_argument("freshness_window must be positive");
  }
  if (config.max_clock_skew.count() < 0) {
    throw std::invalid_argument("max_clock_skew must not be negative");
  }
  if (config.session_timeout.count() <= 0) {
    throw std::invalid_argument("session_timeout must be positive");
  }
  if (config.provider_call_timeout.count() <= 0) {
    throw std::invalid_argument("provider_call_timeout must be positive");
  }
  ValidateRetryPolicy(config.retry);
  if (config.registry_path.empty()) {
    throw std::invalid_argument("registry_path must not be empty");
  }
  if (config.worker_count == 0) {
    throw std::invalid_argument("worker_count must be > 0");
  }
}

}  // namespace mpcrec
