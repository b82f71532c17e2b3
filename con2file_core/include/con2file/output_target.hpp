#pragma once
#include <mutex>
#include <ostream>
#include <streambuf>
#include <vector>

namespace con2file
{

// The process-wide "where does console output go" slot. Handles only touch
// it through this interface, so tests can substitute their own stream.
// All operations on one target are serialized by one lock.
class IOutputTarget
{
 public:
  virtual ~IOutputTarget() = default;

  virtual std::streambuf* Get() const = 0;
  virtual void Set(std::streambuf* buf) = 0;

  // Installs `buf` on top of the redirection stack; returns the buffer it
  // replaced
  virtual std::streambuf* Push(std::streambuf* buf) = 0;

  // Takes `buf` off the stack. When it is on top, the buffer it replaced is
  // installed again and true is returned. Otherwise the entry is spliced
  // out, the stream keeps its current buffer, and false is returned; the
  // entry above then restores what `buf` had replaced.
  virtual bool Remove(std::streambuf* buf) = 0;
};

// Swaps the streambuf behind a std::ostream. Pending output of the outgoing
// buffer is flushed before every swap.
class StreamOutputTarget : public IOutputTarget
{
 public:
  explicit StreamOutputTarget(std::ostream& stream);

  std::streambuf* Get() const override;
  void Set(std::streambuf* buf) override;
  std::streambuf* Push(std::streambuf* buf) override;
  bool Remove(std::streambuf* buf) override;

  std::ostream& Stream() { return stream_; }

 private:
  struct Entry
  {
    std::streambuf* installed;
    std::streambuf* replaced;
  };

  std::ostream& stream_;
  std::vector<Entry> stack_;
  mutable std::mutex mutex_;
};

// std::cout. Every handle that redirects the console must go through this
// single instance so that all swaps share one lock.
IOutputTarget& ConsoleOutput();

}  // namespace con2file
