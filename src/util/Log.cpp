#include "util/Log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <mutex>

namespace lasso::util {

static LogLevel initial_level() {
  const char* env = std::getenv("LASSO_LOG_LEVEL");
  if (env && *env) {
    if (auto lv = parse_log_level(env)) return *lv;
  }
  return LogLevel::Info;
}

static std::atomic<int> g_level{static_cast<int>(initial_level())};
static std::mutex g_sink_mu;
static LogSink g_sink;

const char* to_string(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
  }
  return "info";
}

std::optional<LogLevel> parse_log_level(std::string_view s) {
  if (s == "debug") return LogLevel::Debug;
  if (s == "info")  return LogLevel::Info;
  if (s == "warn" || s == "warning") return LogLevel::Warn;
  if (s == "error") return LogLevel::Error;
  return std::nullopt;
}

void set_log_level(LogLevel level) { g_level.store(static_cast<int>(level)); }

LogLevel log_level() { return static_cast<LogLevel>(g_level.load()); }

void set_log_sink(LogSink sink) {
  std::lock_guard<std::mutex> lk(g_sink_mu);
  g_sink = std::move(sink);
}

void log(LogLevel level, const char* component, const char* fmt, ...) {
  if (static_cast<int>(level) < g_level.load()) return;
  char body[1024];
  va_list ap;
  va_start(ap, fmt);
  std::vsnprintf(body, sizeof(body), fmt, ap);
  va_end(ap);
  std::fprintf(stderr, "lasso: %s: %s\n", component, body);

  // Called unlocked so a sink may log or replace itself
  LogSink sink;
  {
    std::lock_guard<std::mutex> lk(g_sink_mu);
    sink = g_sink;
  }
  if (sink) sink(level, std::string(component) + ": " + body);
}

} // namespace lasso::util
