#pragma once
#include <string>

namespace stexporter {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Неизвестное имя уровня -> Info
LogLevel parse_log_level(const std::string &name) noexcept;
void set_log_level(LogLevel level) noexcept;
bool log_enabled(LogLevel level) noexcept;

void log_err(const char *tag, const std::string &msg);
void log_warn(const char *tag, const std::string &msg);
void log_info(const char *tag, const std::string &msg);
void log_dbg(const char *tag, const std::string &msg);

} // namespace stexporter
