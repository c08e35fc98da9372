#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

namespace Common {

using EpochSeconds = int64_t;

inline auto getWallClockSeconds() noexcept -> EpochSeconds {
  return std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
}

inline auto getNanosSinceEpoch() noexcept -> uint64_t {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count());
}

/// Parse "YYYY-MM-DDTHH:MM:SS[.fff]Z" into UTC epoch seconds.
/// Fractional seconds are truncated.
inline auto parseIso8601(const char* text, EpochSeconds& out) noexcept -> bool {
  if (!text) {
    return false;
  }
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
  if (std::sscanf(text, "%4d-%2d-%2dT%2d:%2d:%2d", &year, &month, &day, &hour, &minute, &second) != 6) {
    return false;
  }
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
    return false;
  }
  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;
  out = static_cast<EpochSeconds>(timegm(&tm));
  return true;
}

/// "2015-08-30T12:36:00Z"
inline auto formatIso8601(EpochSeconds t) -> std::string {
  std::time_t tt = static_cast<std::time_t>(t);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

/// SigV4 timestamps: "20150830T123600Z" and "20150830".
inline auto formatAmzDate(EpochSeconds t, std::string& amz_date, std::string& date_stamp) -> void {
  std::time_t tt = static_cast<std::time_t>(t);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
  amz_date = buf;
  date_stamp = amz_date.substr(0, 8);
}

/// Whole days elapsed from `from` to `now`; negative spans clamp to zero.
inline auto daysBetween(EpochSeconds from, EpochSeconds now) noexcept -> int32_t {
  if (from <= 0 || now <= from) {
    return 0;
  }
  return static_cast<int32_t>((now - from) / 86400);
}

/// Filename-safe local timestamp "YYYYMMDD_HHMMSS".
inline auto getFileTimestamp() -> std::string {
  std::time_t now = std::time(nullptr);
  std::tm tm{};
  localtime_r(&now, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
  return buf;
}

} // namespace Common
