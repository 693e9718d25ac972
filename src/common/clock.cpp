#include "mpcrec/common/clock.hpp"

#include <stdexcept>

namespace mpcrec {

WallClock SystemWallClock() {
  return []() { return std::chrono::system_clock::now(); };
}

uint64_t ToUnixSeconds(std::chrono::system_clock::time_point tp) {
  const auto seconds =
      std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
  if (seconds < 0) {
    throw std::invalid_argument("time point precedes the unix epoch");
  }
  return static_cast<uint64_t>(seconds);
}

std::chrono::system_clock::time_point FromUnixSeconds(uint64_t seconds) {
  return std::chrono::system_clock::time_point(
      std::chrono::seconds(static_cast<int64_t>(seconds)));
}

}  // namespace mpcrec
