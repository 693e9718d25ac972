#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "mpcrec/common/retry.hpp"
#include "mpcrec/derivation/key_set.hpp"
#include "mpcrec/protocol/types.hpp"

namespace mpcrec {

struct NodeConfig {
  PartyIndex self_id = 0;
  KeySet key_set;

  std::vector<std::string> trusted_providers;
  std::string audience;

  std::chrono::seconds freshness_window = std::chrono::seconds(300);
  std::chrono::seconds max_clock_skew = std::chrono::seconds(30);
  std::chrono::milliseconds session_timeout = std::chrono::milliseconds(10000);
  RetryPolicy retry;
  std::chrono::milliseconds provider_call_timeout = std::chrono::milliseconds(5000);

  std::string registry_path = ":memory:";
  size_t worker_count = 4;
};

void ValidateNodeConfig(const NodeConfig& config);

}  // namespace mpcrec
