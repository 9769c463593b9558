#include "quire/util/time.hpp"

#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

namespace quire::util {

std::string Time::toRfc3339(std::chrono::system_clock::time_point time) {
  auto time_t = std::chrono::system_clock::to_time_t(time);
  auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(
      time.time_since_epoch()) % 1000;
  if (milliseconds.count() < 0) {
    milliseconds += std::chrono::milliseconds(1000);
    time_t -= 1;
  }

  std::tm tm{};
  gmtime_r(&time_t, &tm);

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << milliseconds.count() << 'Z';

  return oss.str();
}

Result<std::chrono::system_clock::time_point> Time::fromRfc3339(const std::string& str) {
  static const std::regex rfc3339_regex(
      R"((\d{4})-(\d{2})-(\d{2})[Tt ](\d{2}):(\d{2}):(\d{2})(?:\.(\d{1,9}))?(Z|z|[+-]\d{2}:\d{2})?)");

  std::smatch match;
  if (!std::regex_match(str, match, rfc3339_regex)) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid RFC3339 format: " + str));
  }

  std::tm tm = {};
  tm.tm_year = std::stoi(match[1]) - 1900;
  tm.tm_mon = std::stoi(match[2]) - 1;
  tm.tm_mday = std::stoi(match[3]);
  tm.tm_hour = std::stoi(match[4]);
  tm.tm_min = std::stoi(match[5]);
  tm.tm_sec = std::stoi(match[6]);

  if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
      tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid time values: " + str));
  }

  // Fields are UTC
  auto time_t = timegm(&tm);
  auto time_point = std::chrono::system_clock::from_time_t(time_t);

  if (match[7].matched) {
    std::string fraction = match[7].str();
    fraction.resize(3, '0');
    time_point += std::chrono::milliseconds(std::stoi(fraction));
  }

  if (match[8].matched) {
    std::string zone = match[8].str();
    if (zone != "Z" && zone != "z") {
      int sign = zone[0] == '-' ? -1 : 1;
      int hours = std::stoi(zone.substr(1, 2));
      int minutes = std::stoi(zone.substr(4, 2));
      time_point -= std::chrono::minutes(sign * (hours * 60 + minutes));
    }
  }

  return time_point;
}

std::chrono::system_clock::time_point Time::now() {
  return std::chrono::time_point_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now());
}

std::string Time::localDate(std::chrono::system_clock::time_point time) {
  auto time_t = std::chrono::system_clock::to_time_t(time);
  std::tm tm{};
  localtime_r(&time_t, &tm);

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d");
  return oss.str();
}

std::chrono::system_clock::time_point Time::startOfLocalDay(
    std::chrono::system_clock::time_point time, int days_back) {
  auto time_t = std::chrono::system_clock::to_time_t(time);
  std::tm tm{};
  localtime_r(&time_t, &tm);

  tm.tm_hour = 0;
  tm.tm_min = 0;
  tm.tm_sec = 0;
  tm.tm_mday -= days_back;
  tm.tm_isdst = -1;

  return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

int64_t Time::epochMillis(std::chrono::system_clock::time_point time) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      time.time_since_epoch()).count();
}

}  // namespace quire::util
