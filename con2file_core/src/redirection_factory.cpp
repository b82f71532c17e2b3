#include "con2file/redirection_factory.hpp"

#include <sys/stat.h>

#include <cerrno>
#include <cstdio>
#include <system_error>

#include "con2file/diagnostics.hpp"
#include "con2file/error.hpp"
#include "con2file/path_namer.hpp"
#include "con2file/path_util.hpp"
#include "con2file/rotation_policy.hpp"

namespace con2file
{

std::unique_ptr<RedirectionHandle> RedirectionFactory::CreateTimestamped(
    const std::string& base_path, const std::string& timestamp_format, IOutputTarget& target)
{
  std::string path = MakeTimestampedPath(base_path, timestamp_format);
  return std::make_unique<RedirectionHandle>(path, target);
}

std::unique_ptr<RedirectionHandle> RedirectionFactory::CreateRotating(
    const std::string& base_path, int64_t max_size_bytes, int max_files, IOutputTarget& target)
{
  std::string path = RotationPolicy::EnsureUnderLimit(base_path, max_size_bytes, max_files);
  return std::make_unique<RedirectionHandle>(path, target);
}

std::unique_ptr<RedirectionHandle> RedirectionFactory::CreateTimestampedRotating(
    const std::string& base_path, int64_t max_size_bytes, int max_files,
    const std::string& timestamp_format, IOutputTarget& target)
{
  ValidateLimits(max_size_bytes, max_files);
  std::string stamped = MakeTimestampedPath(base_path, timestamp_format);
  std::string path = RotationPolicy::EnsureUnderLimit(stamped, max_size_bytes, max_files);
  return std::make_unique<RedirectionHandle>(path, target);
}

std::unique_ptr<RedirectionHandle> RedirectionFactory::Create(const RedirectionConfig& config,
                                                              IOutputTarget& target)
{
  switch (config.type)
  {
    case RedirectionType::Simple:
      return std::make_unique<RedirectionHandle>(config.base_path, target);
    case RedirectionType::Timestamped:
      return CreateTimestamped(config.base_path, config.timestamp_format, target);
    case RedirectionType::Rotating:
      return CreateRotating(config.base_path, config.max_size_bytes, config.max_files, target);
    case RedirectionType::TimestampedRotating:
      return CreateTimestampedRotating(config.base_path, config.max_size_bytes,
                                       config.max_files, config.timestamp_format, target);
  }
  throw ValidationError("type", "unknown redirection type");
}

std::future<void> RedirectionFactory::CreateTemporary(const std::string& file_path,
                                                      std::chrono::milliseconds duration,
                                                      CancelToken token, IOutputTarget& target)
{
  auto handle = std::make_unique<RedirectionHandle>(file_path, target);

  if (duration.count() <= 0 || token.IsCancelled())
  {
    handle->Release();
    std::promise<void> done;
    done.set_value();
    return done.get_future();
  }

  return std::async(std::launch::async,
                    [handle = std::move(handle), duration, token]()
                    {
                      if (token.WaitFor(duration))
                      {
                        C2F_LOG_DEBUG("temporary redirection to '{}' cancelled",
                                      handle->FilePath());
                      }
                      handle->Release();
                    });
}

int RedirectionFactory::CleanupRotatedFiles(const std::string& base_path, int max_files)
{
  if (IsBlank(base_path) || max_files <= 0 || max_files >= C2F_MAX_CLEANUP_SCAN)
  {
    return 0;
  }

  int deleted = 0;
  for (int i = max_files + 1; i <= C2F_MAX_CLEANUP_SCAN; ++i)
  {
    std::string path = MakeRotatedPath(base_path, i);
    if (std::remove(path.c_str()) == 0)
    {
      ++deleted;
      continue;
    }
    int err = errno;
    if (err == ENOENT)
    {
      continue;
    }
    C2F_LOG_WARN("cleanup of '{}' stopped at '{}': {}", base_path, path,
                 std::error_code(err, std::generic_category()).message());
    break;
  }
  return deleted;
}

RotationInfo RedirectionFactory::GetRotationInfo(const std::string& base_path)
{
  RotationInfo info;
  if (IsBlank(base_path))
  {
    return info;
  }

  for (int i = 0; i <= C2F_MAX_ROTATION_SCAN; ++i)
  {
    std::string path = (i == 0) ? base_path : MakeRotatedPath(base_path, i);
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0)
    {
      int err = errno;
      if (err != ENOENT)
      {
        C2F_LOG_DEBUG("rotation info for '{}' unavailable: stat '{}': {}", base_path, path,
                      std::error_code(err, std::generic_category()).message());
        return RotationInfo{};
      }
      if (i == 0)
      {
        continue;
      }
      break;
    }

    ++info.file_count;
    info.total_size += static_cast<int64_t>(st.st_size);
    if (!info.newest_path)
    {
      info.newest_path = path;
    }
    info.oldest_path = path;
  }
  return info;
}

}  // namespace con2file
