#pragma once
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace con2file
{

// Counts un-released redirection handles per canonical file path.
// Purely observational: handles never share a writer through it.
class RedirectionRegistry
{
 public:
  static RedirectionRegistry& Instance();

  RedirectionRegistry() = default;
  RedirectionRegistry(const RedirectionRegistry&) = delete;
  RedirectionRegistry& operator=(const RedirectionRegistry&) = delete;

  void Register(const std::string& path);
  // Floors at zero; the entry disappears when it reaches zero
  void Release(const std::string& path);

  int CountFor(const std::string& path) const;
  int TotalCount() const;

  // Snapshot; may be stale by the time the caller looks at it
  std::vector<std::string> ActivePaths() const;

 private:
  static std::string KeyFor(const std::string& path);

  mutable std::mutex mutex_;
  std::unordered_map<std::string, int> counts_;
};

}  // namespace con2file
