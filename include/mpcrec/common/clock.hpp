#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace mpcrec {

using WallClock = std::function<std::chrono::system_clock::time_point()>;

WallClock SystemWallClock();

uint64_t ToUnixSeconds(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point FromUnixSeconds(uint64_t seconds);

}  // namespace mpcrec
