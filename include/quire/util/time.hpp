#pragma once

#include <chrono>
#include <string>

#include "quire/common.hpp"

namespace quire::util {

// Time utilities for RFC3339 formatting and parsing
class Time {
 public:
  // Format time as RFC3339 string in UTC with millisecond precision
  static std::string toRfc3339(std::chrono::system_clock::time_point time);

  // Parse RFC3339 string to time_point. Accepts an optional fraction and a
  // 'Z' or +HH:MM offset.
  static Result<std::chrono::system_clock::time_point> fromRfc3339(const std::string& str);

  // Get current time truncated to milliseconds
  static std::chrono::system_clock::time_point now();

  // Local calendar date (YYYY-MM-DD) of a time point
  static std::string localDate(std::chrono::system_clock::time_point time);

  // Local midnight at the start of the day containing time, shifted by days_back days
  static std::chrono::system_clock::time_point startOfLocalDay(
      std::chrono::system_clock::time_point time, int days_back = 0);

  // Milliseconds since the Unix epoch
  static int64_t epochMillis(std::chrono::system_clock::time_point time);
};

}  // namespace quire::util
