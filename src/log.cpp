#include "stexporter/log.hpp"

#include <atomic>
#include <cstdio>

namespace stexporter {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};

inline void write_line(const char *level, const char *tag,
                       const std::string &msg) {
  std::fprintf(stderr, "[%s][%s] %s\n", level, tag, msg.c_str());
  std::fflush(stderr);
}

} // namespace

LogLevel parse_log_level(const std::string &name) noexcept {
  if (name == "error")
    return LogLevel::Error;
  if (name == "warn" || name == "warning")
    return LogLevel::Warn;
  if (name == "debug")
    return LogLevel::Debug;
  return LogLevel::Info;
}

void set_log_level(LogLevel level) noexcept {
  g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

bool log_enabled(LogLevel level) noexcept {
  return static_cast<int>(level) <= g_level.load(std::memory_order_relaxed);
}

void log_err(const char *tag, const std::string &msg) {
  write_line("ERR", tag, msg);
}

void log_warn(const char *tag, const std::string &msg) {
  if (log_enabled(LogLevel::Warn))
    write_line("WRN", tag, msg);
}

void log_info(const char *tag, const std::string &msg) {
  if (log_enabled(LogLevel::Info))
    write_line("INF", tag, msg);
}

void log_dbg(const char *tag, const std::string &msg) {
  if (log_enabled(LogLevel::Debug))
    write_line("DBG", tag, msg);
}

} // namespace stexporter
