#pragma once
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "cancel_token.hpp"
#include "output_target.hpp"
#include "platform.hpp"
#include "redirection_config.hpp"
#include "redirection_handle.hpp"

namespace con2file
{

struct RotationInfo
{
  int file_count = 0;
  int64_t total_size = 0;
  std::optional<std::string> oldest_path;  // highest backup index present
  std::optional<std::string> newest_path;  // base file, else lowest index
};

class RedirectionFactory
{
 public:
  // base "logs/app.log" -> "logs/app-20250101-120000.log"
  static std::unique_ptr<RedirectionHandle> CreateTimestamped(
      const std::string& base_path,
      const std::string& timestamp_format = C2F_DEFAULT_TIMESTAMP_FORMAT,
      IOutputTarget& target = ConsoleOutput());

  // Rotates base_path first if it has reached max_size_bytes
  static std::unique_ptr<RedirectionHandle> CreateRotating(
      const std::string& base_path, int64_t max_size_bytes,
      int max_files = C2F_DEFAULT_MAX_FILES, IOutputTarget& target = ConsoleOutput());

  // Timestamps the name, then rotates the timestamped file
  static std::unique_ptr<RedirectionHandle> CreateTimestampedRotating(
      const std::string& base_path, int64_t max_size_bytes, int max_files,
      const std::string& timestamp_format = C2F_DEFAULT_TIMESTAMP_FORMAT,
      IOutputTarget& target = ConsoleOutput());

  static std::unique_ptr<RedirectionHandle> Create(const RedirectionConfig& config,
                                                   IOutputTarget& target = ConsoleOutput());

  // Redirects for `duration`, then releases. The handle is opened before
  // returning, so path and I/O errors throw here. The task ends early when
  // `token` is cancelled and releases the handle on every path. Like any
  // std::async future, the result waits for the task when destroyed, so
  // the caller must keep it.
  [[nodiscard]] static std::future<void> CreateTemporary(
      const std::string& file_path, std::chrono::milliseconds duration,
      CancelToken token = CancelToken(), IOutputTarget& target = ConsoleOutput());

  // Deletes "name.<i>.ext" for i > max_files; returns how many were removed.
  // Gaps are skipped. An I/O error stops the sweep and the count so far is
  // returned.
  static int CleanupRotatedFiles(const std::string& base_path, int max_files);

  // Base file plus backups 1, 2, ... up to the first gap. All zero on
  // failure.
  static RotationInfo GetRotationInfo(const std::string& base_path);
};

}  // namespace con2file
