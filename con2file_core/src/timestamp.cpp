#include "con2file/timestamp.hpp"

#include <time.h>

#include <cstdio>

namespace con2file
{

uint64_t wall_clock_now_ns()
{
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL +
         static_cast<uint64_t>(ts.tv_nsec);
}

size_t format_timestamp(uint64_t wall_ns, char* buf, size_t buf_size)
{
  if (buf_size == 0) return 0;
  time_t sec = static_cast<time_t>(wall_ns / 1'000'000'000ULL);
  uint32_t us = static_cast<uint32_t>((wall_ns % 1'000'000'000ULL) / 1'000ULL);
  struct tm tm_val{};
  localtime_r(&sec, &tm_val);
  int n = std::snprintf(buf, buf_size, "%04d-%02d-%02d %02d:%02d:%02d.%06u",
                        tm_val.tm_year + 1900, tm_val.tm_mon + 1, tm_val.tm_mday,
                        tm_val.tm_hour, tm_val.tm_min, tm_val.tm_sec, us);
  return (n > 0 && static_cast<size_t>(n) < buf_size) ? static_cast<size_t>(n)
                                                      : (buf_size - 1);
}

std::string format_local_time(std::time_t t, const char* pattern)
{
  if (pattern == nullptr || *pattern == '\0') return {};
  struct tm tm_val{};
  localtime_r(&t, &tm_val);
  char buf[256];
  size_t n = std::strftime(buf, sizeof(buf), pattern, &tm_val);
  return std::string(buf, n);
}

}  // namespace con2file
