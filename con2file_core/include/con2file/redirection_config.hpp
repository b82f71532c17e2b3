#pragma once
#include <cstdint>
#include <string>
#include <string_view>

#include "platform.hpp"

namespace con2file
{

enum class RedirectionType : uint8_t
{
  Simple,               // one file, appended to
  Timestamped,          // "name-<time>.ext", a fresh file per session
  Rotating,             // size-based rotation with numbered backups
  TimestampedRotating,  // timestamped name, then rotation of that file
};

constexpr std::string_view to_string(RedirectionType type)
{
  switch (type)
  {
    case RedirectionType::Simple: return "simple";
    case RedirectionType::Timestamped: return "timestamped";
    case RedirectionType::Rotating: return "rotating";
    case RedirectionType::TimestampedRotating: return "timestamped-rotating";
  }
  return "unknown";
}

struct RedirectionConfig
{
  std::string base_path;
  RedirectionType type = RedirectionType::Simple;
  int64_t max_size_bytes = C2F_DEFAULT_MAX_SIZE_BYTES;
  int max_files = C2F_DEFAULT_MAX_FILES;
  std::string timestamp_format = C2F_DEFAULT_TIMESTAMP_FORMAT;
};

}  // namespace con2file
