#include "mpcrec/common/logging.hpp"

#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace mpcrec {
namespace {

constexpr char kLoggerName[] = "mpcrec";
constexpr char kSecurityLoggerName[] = "mpcrec.security";

std::shared_ptr<spdlog::logger> GetOrCreate(const std::string& name) {
  if (auto existing = spdlog::get(name)) {
    return existing;
  }
  try {
    return spdlog::stderr_color_mt(name);
  } catch (const spdlog::spdlog_ex&) {
    // Another thread registered the same name first.
    auto registered = spdlog::get(name);
    if (!registered) {
      throw;
    }
    return registered;
  }
}

}  // namespace

std::shared_ptr<spdlog::logger> Log() {
  static const std::shared_ptr<spdlog::logger> logger = GetOrCreate(kLoggerName);
  return logger;
}

std::shared_ptr<spdlog::logger> SecurityLog() {
  static const std::shared_ptr<spdlog::logger> logger = GetOrCreate(kSecurityLoggerName);
  return logger;
}

void SetLogLevel(spdlog::level::level_enum level) {
  Log()->set_level(level);
  SecurityLog()->set_level(level);
}

void LogSecurityEvent(ErrorCode code, std::string_view where, std::string_view detail) {
  SecurityLog()->warn("[{}] {}: {}", where, ErrorCodeName(code), detail);
}

}  // namespace mpcrec
