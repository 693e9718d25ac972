#pragma once

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

#include "mpcrec/common/errors.hpp"

namespace mpcrec {

std::shared_ptr<spdlog::logger> Log();

// Anomalies that may indicate an attack: bad signatures, replays, equivocation.
std::shared_ptr<spdlog::logger> SecurityLog();

void SetLogLevel(spdlog::level::level_enum level);

void LogSecurityEvent(ErrorCode code, std::string_view where, std::string_view detail);

}  // namespace mpcrec
