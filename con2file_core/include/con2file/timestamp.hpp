#pragma once
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <string>

namespace con2file
{

uint64_t wall_clock_now_ns();

// "YYYY-MM-DD HH:MM:SS.uuuuuu" in local time, used as the diagnostics prefix
size_t format_timestamp(uint64_t wall_ns, char* buf, size_t buf_size);

// strftime() of t in local time; returns an empty string when the pattern
// expands to nothing or does not fit
std::string format_local_time(std::time_t t, const char* pattern);

}  // namespace con2file
