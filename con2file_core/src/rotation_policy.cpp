#include "con2file/rotation_policy.hpp"

#include <cerrno>
#include <cstdio>
#include <system_error>

#include "con2file/diagnostics.hpp"
#include "con2file/path_namer.hpp"
#include "con2file/path_util.hpp"

namespace con2file
{

namespace
{

std::string ErrnoText(int err) { return std::error_code(err, std::generic_category()).message(); }

// Missing files count as removed
bool RemoveIfExists(const std::string& path, const std::string& base_path)
{
  if (std::remove(path.c_str()) == 0)
  {
    return true;
  }
  int err = errno;
  if (err == ENOENT)
  {
    return true;
  }
  C2F_LOG_WARN("rotation of '{}' aborted: cannot remove '{}': {}", base_path, path,
               ErrnoText(err));
  return false;
}

bool MoveFile(const std::string& from, const std::string& to, const std::string& base_path)
{
  if (!RemoveIfExists(to, base_path))
  {
    return false;
  }
  if (std::rename(from.c_str(), to.c_str()) != 0)
  {
    int err = errno;
    C2F_LOG_WARN("rotation of '{}' aborted: cannot move '{}' to '{}': {}", base_path, from,
                 to, ErrnoText(err));
    return false;
  }
  return true;
}

}  // namespace

void RotationConfig::Validate() const
{
  ValidatePath(base_path, "base_path");
  ValidateLimits(max_size_bytes, max_files);
}

RotationPolicy::RotationPolicy(RotationConfig config) : config_(std::move(config))
{
  config_.Validate();
}

bool RotationPolicy::NeedsRotation() const
{
  auto size = FileSizeOf(config_.base_path);
  return size.has_value() && *size >= config_.max_size_bytes;
}

std::string RotationPolicy::EnsureUnderLimit() const
{
  if (NeedsRotation())
  {
    Rotate(config_.base_path, config_.max_files);
  }
  return config_.base_path;
}

std::string RotationPolicy::EnsureUnderLimit(const std::string& base_path,
                                             int64_t max_size_bytes, int max_files)
{
  RotationConfig config;
  config.base_path = base_path;
  config.max_size_bytes = max_size_bytes;
  config.max_files = max_files;
  return RotationPolicy(std::move(config)).EnsureUnderLimit();
}

bool RotationPolicy::Rotate(const std::string& base_path, int max_files)
{
  if (max_files <= 0)
  {
    return false;
  }

  // 1. oldest backup drops out
  if (!RemoveIfExists(MakeRotatedPath(base_path, max_files), base_path))
  {
    return false;
  }

  // 2. shift N-1 .. 1 up by one
  for (int i = max_files - 1; i >= 1; --i)
  {
    std::string current = MakeRotatedPath(base_path, i);
    if (!FileExists(current))
    {
      continue;
    }
    if (!MoveFile(current, MakeRotatedPath(base_path, i + 1), base_path))
    {
      return false;
    }
  }

  // 3. base becomes the newest backup
  if (!MoveFile(base_path, MakeRotatedPath(base_path, 1), base_path))
  {
    return false;
  }

  C2F_LOG_DEBUG("rotated '{}' (keeping {} backups)", base_path, max_files);
  return true;
}

}  // namespace con2file
