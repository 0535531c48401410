#pragma once

#include <string_view>

namespace microbench {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Off = 3 };

// Threshold starts at Warn, or at the value of MICROBENCH_LOG when set.
LogLevel log_level() noexcept;
void set_log_level(LogLevel level) noexcept;
bool parse_log_level(std::string_view text, LogLevel& out) noexcept;

// Writes "[tag] message" to stderr when level passes the threshold.
void log(LogLevel level, std::string_view message);

inline void log_debug(std::string_view message) { log(LogLevel::Debug, message); }
inline void log_info(std::string_view message) { log(LogLevel::Info, message); }
inline void log_warn(std::string_view message) { log(LogLevel::Warn, message); }

}  // namespace microbench
