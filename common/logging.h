#pragma once

// ============================================================================
// logging.h - Async logger with printf-style macros
// ============================================================================
//
// Producers format a line into a fixed-size record and push it onto a
// bounded MPMC ring. A single writer thread drains the ring into the log file.
// Lines at or above the console level are also mirrored to stderr.
//
// Line format: [sec.nanos][LEVEL][Tid] message

#include <cstddef>
#include <cstdint>

#include "common/macros.h"

namespace Common {

enum class LogLevel : uint8_t {
  DEBUG = 0,
  INFO = 1,
  WARN = 2,
  ERROR = 3,
  OFF = 4
};

struct LoggerStats {
  uint64_t messages_written{0};
  uint64_t messages_dropped{0};
  uint64_t bytes_written{0};
};

// Start the writer thread. Safe to call again; the previous logger is flushed
// and replaced.
auto initLogging(const char* log_file) noexcept -> bool;

// Drain the queue, join the writer, close the file.
auto shutdownLogging() noexcept -> void;

auto setLogLevel(LogLevel level) noexcept -> void;
auto setConsoleLevel(LogLevel level) noexcept -> void;
[[nodiscard]] auto getLogLevel() noexcept -> LogLevel;

// Accepts DEBUG, INFO, WARN, WARNING, ERROR, OFF (case-insensitive).
[[nodiscard]] auto parseLogLevel(const char* text, LogLevel& out) noexcept -> bool;
[[nodiscard]] auto logLevelName(LogLevel level) noexcept -> const char*;

[[nodiscard]] auto getLoggerStats() noexcept -> LoggerStats;

void logMessage(LogLevel level, const char* format, ...) noexcept PRINTF_FORMAT(2, 3);

} // namespace Common

#define LOG_DEBUG(...) ::Common::logMessage(::Common::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INFO(...)  ::Common::logMessage(::Common::LogLevel::INFO, __VA_ARGS__)
#define LOG_WARN(...)  ::Common::logMessage(::Common::LogLevel::WARN, __VA_ARGS__)
#define LOG_ERROR(...) ::Common::logMessage(::Common::LogLevel::ERROR, __VA_ARGS__)
