#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace con2file
{

struct PathParts
{
  std::string dir;   // without trailing '/', empty for a bare file name
  std::string stem;  // file name without extension; ".profile" is all stem
  std::string ext;   // including the dot, empty when there is none
};

PathParts SplitPath(const std::string& path);
std::string JoinPath(const std::string& dir, const std::string& name);

// Empty or whitespace only
bool IsBlank(const std::string& s);

// Throws ValidationError unless `path` can name a regular file on this host
void ValidatePath(const std::string& path, const char* argument = "path");
// Throws ValidationError when either limit is not positive
void ValidateLimits(int64_t max_size_bytes, int max_files);

// Absolute path with "." and ".." collapsed. Symlinks in the parent directory
// are resolved when it exists, so every spelling of one file maps to one key.
std::string Canonicalize(const std::string& path);

// mkdir -p; returns 0 or the errno of the failing step
int MakeDirectories(const std::string& dir);

bool FileExists(const std::string& path);
// std::nullopt when the file is missing or stat() fails
std::optional<int64_t> FileSizeOf(const std::string& path);

}  // namespace con2file
