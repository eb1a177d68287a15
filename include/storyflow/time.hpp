#pragma once
#include <chrono>
#include <ctime>
#include <string>

namespace storyflow::timeutil {

// Format ±HH:MM from minutes (e.g., +180 -> "+03:00", -420 -> "-07:00")
auto tz_offset_string(int minutes) -> std::string;

// "2026-10-19T14:03:07.123456+00:00" (UTC, microsecond precision)
auto iso8601_utc(std::chrono::system_clock::time_point when) -> std::string;

inline auto now_iso8601() -> std::string { return iso8601_utc(std::chrono::system_clock::now()); }

} // namespace storyflow::timeutil
