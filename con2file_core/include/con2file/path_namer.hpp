#pragma once
#include <ctime>
#include <string>

#include "platform.hpp"

namespace con2file
{

// "dir/app.log" -> "dir/app-20250101-120000.log" (strftime pattern, local time)
std::string MakeTimestampedPath(const std::string& base_path, const std::string& format,
                                std::time_t now);
std::string MakeTimestampedPath(const std::string& base_path,
                                const std::string& format = C2F_DEFAULT_TIMESTAMP_FORMAT);

// "dir/app.log", 2 -> "dir/app.2.log"; index starts at 1
std::string MakeRotatedPath(const std::string& base_path, int index);

}  // namespace con2file
