// ============================================================================
// TIME UTILS - NTP-backed wall clock helpers
// ============================================================================
// Tiny header-only wrappers around time()/localtime()/strftime().
// The clock is considered synchronized once the year is past 2020.
// ============================================================================

#ifndef TIME_UTILS_H
#define TIME_UTILS_H

#include <Arduino.h>
#include <time.h>

namespace TimeUtils {

inline time_t epochSeconds() {
  return time(nullptr);
}

inline bool isSynchronized() {
  time_t now = time(nullptr);
  struct tm timeinfo;
  localtime_r(&now, &timeinfo);
  return timeinfo.tm_year > (2020 - 1900);
}

/**
 * Format a timestamp with strftime
 * @param fmt strftime pattern
 * @param when Epoch seconds (default: now)
 */
inline String format(const char* fmt, time_t when = 0) {
  if (when == 0) when = time(nullptr);
  struct tm timeinfo;
  localtime_r(&when, &timeinfo);
  char buf[40];
  strftime(buf, sizeof(buf), fmt, &timeinfo);
  return String(buf);
}

} // namespace TimeUtils

#endif // TIME_UTILS_H
