#include "con2file/path_namer.hpp"

#include <fmt/format.h>

#include "con2file/error.hpp"
#include "con2file/path_util.hpp"
#include "con2file/timestamp.hpp"

namespace con2file
{

std::string MakeTimestampedPath(const std::string& base_path, const std::string& format,
                                std::time_t now)
{
  if (IsBlank(base_path))
  {
    throw ValidationError("base_path", "path is empty");
  }
  if (format.empty())
  {
    throw ValidationError("format", "timestamp format is empty");
  }

  std::string stamp = format_local_time(now, format.c_str());
  if (stamp.empty())
  {
    throw ValidationError("format", "timestamp format produced no text");
  }

  PathParts parts = SplitPath(base_path);
  return JoinPath(parts.dir, fmt::format("{}-{}{}", parts.stem, stamp, parts.ext));
}

std::string MakeTimestampedPath(const std::string& base_path, const std::string& format)
{
  return MakeTimestampedPath(base_path, format, std::time(nullptr));
}

std::string MakeRotatedPath(const std::string& base_path, int index)
{
  if (index < 1)
  {
    throw ValidationError("index", "rotation index starts at 1");
  }
  PathParts parts = SplitPath(base_path);
  return JoinPath(parts.dir, fmt::format("{}.{}{}", parts.stem, index, parts.ext));
}

}  // namespace con2file
