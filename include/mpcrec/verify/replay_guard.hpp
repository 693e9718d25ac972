#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <span>
#include <string>
#include <string_view>

namespace mpcrec {

// Remembers accepted (account, nonce) pairs while their timestamp can still
// pass the freshness check.
class ReplayGuard {
 public:
  explicit ReplayGuard(std::chrono::seconds retention);

  bool Contains(std::string_view account_id, std::span<const uint8_t> nonce) const;

  // Atomically records the pair; false if it was already recorded.
  bool TryRecord(std::string_view account_id,
                 std::span<const uint8_t> nonce,
                 uint64_t timestamp,
                 uint64_t now);

  size_t size() const;

 private:
  static std::string Key(std::string_view account_id, std::span<const uint8_t> nonce);
  void PruneLocked(uint64_t now);

  uint64_t retention_seconds_;
  mutable std::mutex mu_;
  std::map<std::string, uint64_t> expires_at_;
};

}  // namespace mpcrec
