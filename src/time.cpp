#include "storyflow/time.hpp"

#include <cstdio>

namespace storyflow::timeutil {

std::string tz_offset_string(int minutes) {
  char buf[8];
  char sign = minutes >= 0 ? '+' : '-';
  int m = minutes >= 0 ? minutes : -minutes;
  int hh = m / 60;
  int mm = m % 60;
  std::snprintf(buf, sizeof(buf), "%c%02d:%02d", sign, hh, mm);
  return std::string(buf);
}

static std::string format_tm(const std::tm &tm, long micros, int tz_minutes) {
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06ld", tm.tm_year + 1900,
                tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, micros);
  return std::string(buf) + tz_offset_string(tz_minutes);
}

std::string iso8601_utc(std::chrono::system_clock::time_point when) {
  const std::time_t t = std::chrono::system_clock::to_time_t(when);
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                          when.time_since_epoch() % std::chrono::seconds(1))
                          .count();
  std::tm gt{};
  gmtime_r(&t, &gt);
  return format_tm(gt, static_cast<long>(micros), 0);
}

} // namespace storyflow::timeutil
