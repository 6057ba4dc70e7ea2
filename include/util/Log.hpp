// Leveled diagnostics on stderr: "idlectl: <component>: message"
#pragma once

#include <optional>
#include <string_view>

namespace idlectl::util {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

void set_log_level(LogLevel level);
[[nodiscard]] LogLevel log_level();
[[nodiscard]] bool log_enabled(LogLevel level);

// Accepts error/warn/warning/info/debug (case-insensitive).
[[nodiscard]] auto parse_log_level(std::string_view s) -> std::optional<LogLevel>;

void log_msg(LogLevel level, const char* component, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));

} // namespace idlectl::util

#define IDLECTL_LOG_ERROR(comp, ...) ::idlectl::util::log_msg(::idlectl::util::LogLevel::Error, comp, __VA_ARGS__)
#define IDLECTL_LOG_WARN(comp, ...)  ::idlectl::util::log_msg(::idlectl::util::LogLevel::Warn, comp, __VA_ARGS__)
#define IDLECTL_LOG_INFO(comp, ...)  ::idlectl::util::log_msg(::idlectl::util::LogLevel::Info, comp, __VA_ARGS__)
#define IDLECTL_LOG_DEBUG(comp, ...) ::idlectl::util::log_msg(::idlectl::util::LogLevel::Debug, comp, __VA_ARGS__)
