// Minimal leveled diagnostics: "lasso: <Component>: <message>" on stderr
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace lasso::util {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

[[nodiscard]] const char* to_string(LogLevel level);
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view s);

void set_log_level(LogLevel level);
[[nodiscard]] LogLevel log_level();

// Receives every emitted line (already formatted, no trailing newline).
// Pass an empty function to detach. Stderr output is unaffected.
using LogSink = std::function<void(LogLevel, const std::string&)>;
void set_log_sink(LogSink sink);

void log(LogLevel level, const char* component, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));

} // namespace lasso::util

#define LASSO_LOG_DEBUG(comp, ...) ::lasso::util::log(::lasso::util::LogLevel::Debug, comp, __VA_ARGS__)
#define LASSO_LOG_INFO(comp, ...)  ::lasso::util::log(::lasso::util::LogLevel::Info,  comp, __VA_ARGS__)
#define LASSO_LOG_WARN(comp, ...)  ::lasso::util::log(::lasso::util::LogLevel::Warn,  comp, __VA_ARGS__)
#define LASSO_LOG_ERROR(comp, ...) ::lasso::util::log(::lasso::util::LogLevel::Error, comp, __VA_ARGS__)
