#include "mpcrec/verify/replay_guard.hpp"

#include <stdexcept>

namespace mpcrec {

ReplayGuard::ReplayGuard(std::chrono::seconds retention)
    : retention_seconds_(static_cast<uint64_t>(retention.count())) {
  if (retention.count() <= 0) {
    throw std::invalid_argument("replay retention must be positive");
  }
}

bool ReplayGuard::Contains(std::string_view account_id, std::span<const uint8_t> nonce) const {
  std::lock_guard<std::mutex> lock(mu_);
  return expires_at_.contains(Key(account_id, nonce));
}

bool ReplayGuard::TryRecord(std::string_view account_id,
                            std::span<const uint8_t> nonce,
                            uint64_t timestamp,
                            uint64_t now) {
  std::lock_guard<std::mutex> lock(mu_);
  PruneLocked(now);
  return expires_at_.emplace(Key(account_id, nonce), timestamp + retention_seconds_).second;
}

size_t ReplayGuard::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return expires_at_.size();
}

std::string ReplayGuard::Key(std::string_view account_id, std::span<const uint8_t> nonce) {
  std::string key;
  key.reserve(account_id.size() + 1 + nonce.size());
  key.append(account_id);
  key.push_back('\0');
  key.append(reinterpret_cast<const char*>(nonce.data()), nonce.size());
  return key;
}

void ReplayGuard::PruneLocked(uint64_t now) {
  for (auto it = expires_at_.begin(); it != expires_at_.end();) {
    if (it->second < now) {
      it = expires_at_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace mpcrec
