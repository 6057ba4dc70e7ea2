#include "util/Log.hpp"

#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <string>

namespace idlectl::util {

static std::atomic<int> g_level{static_cast<int>(LogLevel::Warn)};

void set_log_level(LogLevel level) { g_level.store(static_cast<int>(level)); }

LogLevel log_level() { return static_cast<LogLevel>(g_level.load()); }

bool log_enabled(LogLevel level) { return static_cast<int>(level) <= g_level.load(); }

auto parse_log_level(std::string_view s) -> std::optional<LogLevel> {
  std::string low;
  for (char c : s) low.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (low == "error") return LogLevel::Error;
  if (low == "warn" || low == "warning") return LogLevel::Warn;
  if (low == "info") return LogLevel::Info;
  if (low == "debug") return LogLevel::Debug;
  return std::nullopt;
}

void log_msg(LogLevel level, const char* component, const char* fmt, ...) {
  if (!log_enabled(level)) return;
  char buf[512];
  va_list ap;
  va_start(ap, fmt);
  std::vsnprintf(buf, sizeof(buf), fmt, ap);
  va_end(ap);
  std::fprintf(stderr, "idlectl: %s: %s\n", component, buf);
}

} // namespace idlectl::util
