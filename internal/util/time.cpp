#include "time.hpp"

#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace shipx::util {

namespace {

std::tm LocalTime(std::time_t t) {
  std::tm local{};
  if (localtime_r(&t, &local) == nullptr) {
    throw std::runtime_error("localtime_r failed");
  }
  return local;
}

std::string FormatTm(const std::tm& tm) {
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
  return buffer;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

std::string FormatDate(TimePoint tp) {
  return FormatTm(LocalTime(Clock::to_time_t(tp)));
}

std::string NextDay(TimePoint tp) {
  std::tm day = LocalTime(Clock::to_time_t(tp));
  // Noon keeps mktime normalization clear of DST transitions.
  day.tm_mday += 1;
  day.tm_hour  = 12;
  day.tm_min   = 0;
  day.tm_sec   = 0;
  day.tm_isdst = -1;

  const std::time_t normalized = std::mktime(&day);
  if (normalized == static_cast<std::time_t>(-1)) {
    throw std::runtime_error("mktime failed");
  }
  return FormatTm(LocalTime(normalized));
}

} // namespace shipx::util
