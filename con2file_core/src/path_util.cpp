#include "con2file/path_util.hpp"

#include <limits.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <vector>

#include "con2file/error.hpp"

namespace con2file
{

PathParts SplitPath(const std::string& path)
{
  PathParts parts;
  std::string name = path;

  size_t slash = path.rfind('/');
  if (slash != std::string::npos)
  {
    parts.dir = (slash == 0) ? "/" : path.substr(0, slash);
    name = path.substr(slash + 1);
  }

  size_t dot = name.rfind('.');
  if (dot != std::string::npos && dot > 0 && dot + 1 < name.size())
  {
    parts.stem = name.substr(0, dot);
    parts.ext = name.substr(dot);
  }
  else
  {
    parts.stem = name;
  }
  return parts;
}

std::string JoinPath(const std::string& dir, const std::string& name)
{
  if (dir.empty()) return name;
  if (dir.back() == '/') return dir + name;
  return dir + "/" + name;
}

bool IsBlank(const std::string& s)
{
  for (char c : s)
  {
    if (!std::isspace(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

void ValidatePath(const std::string& path, const char* argument)
{
  if (IsBlank(path))
  {
    throw ValidationError(argument, "path is empty");
  }
  if (path.find('\0') != std::string::npos)
  {
    throw ValidationError(argument, "path contains a NUL character");
  }
  if (path.size() >= PATH_MAX)
  {
    throw ValidationError(argument, "path is too long");
  }

  size_t slash = path.rfind('/');
  std::string name = (slash == std::string::npos) ? path : path.substr(slash + 1);
  if (name.empty() || name == "." || name == "..")
  {
    throw ValidationError(argument, "path does not name a file");
  }

  size_t begin = 0;
  while (begin <= path.size())
  {
    size_t end = path.find('/', begin);
    if (end == std::string::npos) end = path.size();
    if (end - begin > NAME_MAX)
    {
      throw ValidationError(argument, "path component is too long");
    }
    begin = end + 1;
  }
}

void ValidateLimits(int64_t max_size_bytes, int max_files)
{
  if (max_size_bytes <= 0)
  {
    throw ValidationError("max_size_bytes", "must be greater than zero");
  }
  if (max_files <= 0)
  {
    throw ValidationError("max_files", "must be greater than zero");
  }
}

std::string Canonicalize(const std::string& path)
{
  if (path.empty()) return {};

  std::string absolute = path;
  if (path.front() != '/')
  {
    char cwd[PATH_MAX];
    if (::getcwd(cwd, sizeof(cwd)) != nullptr)
    {
      absolute = JoinPath(cwd, path);
    }
  }

  std::vector<std::string> segments;
  size_t begin = 0;
  while (begin <= absolute.size())
  {
    size_t end = absolute.find('/', begin);
    if (end == std::string::npos) end = absolute.size();
    std::string seg = absolute.substr(begin, end - begin);
    if (seg == "..")
    {
      if (!segments.empty()) segments.pop_back();
    }
    else if (!seg.empty() && seg != ".")
    {
      segments.push_back(seg);
    }
    begin = end + 1;
  }

  // Without a working directory the result stays relative
  bool rooted = absolute.front() == '/';
  std::string normalized;
  for (const auto& seg : segments)
  {
    if (rooted || !normalized.empty()) normalized += '/';
    normalized += seg;
  }
  if (normalized.empty()) return rooted ? "/" : ".";

  PathParts parts = SplitPath(normalized);
  char resolved[PATH_MAX];
  if (rooted && ::realpath(parts.dir.c_str(), resolved) != nullptr)
  {
    return JoinPath(resolved, parts.stem + parts.ext);
  }
  return normalized;
}

int MakeDirectories(const std::string& dir)
{
  if (dir.empty()) return 0;

  std::string tmp;
  for (size_t i = 0; i < dir.size(); ++i)
  {
    tmp += dir[i];
    if ((dir[i] == '/' && i > 0) || i == dir.size() - 1)
    {
      if (::mkdir(tmp.c_str(), 0755) != 0 && errno != EEXIST)
      {
        return errno;
      }
    }
  }

  struct stat st{};
  if (::stat(dir.c_str(), &st) != 0) return errno;
  if (!S_ISDIR(st.st_mode)) return ENOTDIR;
  return 0;
}

bool FileExists(const std::string& path)
{
  struct stat st{};
  return ::stat(path.c_str(), &st) == 0;
}

std::optional<int64_t> FileSizeOf(const std::string& path)
{
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) return std::nullopt;
  return static_cast<int64_t>(st.st_size);
}

}  // namespace con2file
