#include "con2file/output_target.hpp"

#include <iostream>

namespace con2file
{

StreamOutputTarget::StreamOutputTarget(std::ostream& stream) : stream_(stream) {}

std::streambuf* StreamOutputTarget::Get() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return stream_.rdbuf();
}

void StreamOutputTarget::Set(std::streambuf* buf)
{
  std::lock_guard<std::mutex> lock(mutex_);
  stream_.flush();
  stream_.rdbuf(buf);
}

std::streambuf* StreamOutputTarget::Push(std::streambuf* buf)
{
  std::lock_guard<std::mutex> lock(mutex_);
  stream_.flush();
  std::streambuf* replaced = stream_.rdbuf(buf);
  stack_.push_back(Entry{buf, replaced});
  return replaced;
}

bool StreamOutputTarget::Remove(std::streambuf* buf)
{
  std::lock_guard<std::mutex> lock(mutex_);
  for (size_t i = stack_.size(); i-- > 0;)
  {
    if (stack_[i].installed != buf)
    {
      continue;
    }

    if (i + 1 == stack_.size())
    {
      stream_.flush();
      stream_.rdbuf(stack_[i].replaced);
      stack_.pop_back();
      return true;
    }

    // Released under a newer redirection: hand our predecessor to it
    stack_[i + 1].replaced = stack_[i].replaced;
    stack_.erase(stack_.begin() + static_cast<std::ptrdiff_t>(i));
    return false;
  }
  return false;
}

IOutputTarget& ConsoleOutput()
{
  static StreamOutputTarget console(std::cout);
  return console;
}

}  // namespace con2file
