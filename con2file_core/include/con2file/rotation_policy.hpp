#pragma once
#include <cstdint>
#include <string>

#include "platform.hpp"

namespace con2file
{

struct RotationConfig
{
  std::string base_path;
  int64_t max_size_bytes = C2F_DEFAULT_MAX_SIZE_BYTES;
  int max_files = C2F_DEFAULT_MAX_FILES;
  std::string timestamp_format = C2F_DEFAULT_TIMESTAMP_FORMAT;

  // Throws ValidationError for a blank path or a non-positive limit
  void Validate() const;
};

// Size-triggered rotation of "name.ext" into "name.1.ext" .. "name.N.ext",
// where 1 is the newest backup and N the oldest.
//
// Rotation is best effort: the first failing unlink/rename aborts the
// remaining steps, logs a warning and leaves the base file where it is, so
// the caller keeps appending to an unrotated file.
class RotationPolicy
{
 public:
  explicit RotationPolicy(RotationConfig config);

  const RotationConfig& Config() const { return config_; }

  bool NeedsRotation() const;

  // Rotates when the base file has reached max_size_bytes; always returns
  // the base path, which is where the caller writes next.
  std::string EnsureUnderLimit() const;

  static std::string EnsureUnderLimit(const std::string& base_path, int64_t max_size_bytes,
                                      int max_files);

  // Unconditional rotation; false when a step failed
  static bool Rotate(const std::string& base_path, int max_files);

 private:
  const RotationConfig config_;
};

}  // namespace con2file
