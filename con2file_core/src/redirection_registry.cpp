#include "con2file/redirection_registry.hpp"

#include "con2file/path_util.hpp"

namespace con2file
{

RedirectionRegistry& RedirectionRegistry::Instance()
{
  static RedirectionRegistry inst;
  return inst;
}

std::string RedirectionRegistry::KeyFor(const std::string& path)
{
  if (IsBlank(path)) return {};
  return Canonicalize(path);
}

void RedirectionRegistry::Register(const std::string& path)
{
  std::string key = KeyFor(path);
  if (key.empty()) return;
  std::lock_guard<std::mutex> lock(mutex_);
  ++counts_[key];
}

void RedirectionRegistry::Release(const std::string& path)
{
  std::string key = KeyFor(path);
  if (key.empty()) return;
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = counts_.find(key);
  if (it == counts_.end())
  {
    return;
  }
  if (--it->second <= 0)
  {
    counts_.erase(it);
  }
}

int RedirectionRegistry::CountFor(const std::string& path) const
{
  std::string key = KeyFor(path);
  if (key.empty()) return 0;
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = counts_.find(key);
  return it == counts_.end() ? 0 : it->second;
}

int RedirectionRegistry::TotalCount() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  int total = 0;
  for (const auto& kv : counts_)
  {
    total += kv.second;
  }
  return total;
}

std::vector<std::string> RedirectionRegistry::ActivePaths() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> paths;
  paths.reserve(counts_.size());
  for (const auto& kv : counts_)
  {
    if (kv.second > 0)
    {
      paths.push_back(kv.first);
    }
  }
  return paths;
}

}  // namespace con2file
