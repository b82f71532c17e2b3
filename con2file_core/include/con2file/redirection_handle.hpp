#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <streambuf>
#include <string>

#include "file_stream_buf.hpp"
#include "output_target.hpp"
#include "redirection_registry.hpp"

namespace con2file
{

// Redirects an output target (std::cout by default) into a file for the
// lifetime of the handle.
//
// Construction opens `file_path` for append (creating missing parent
// directories), registers the canonical path with the registry and swaps the
// target to the new file. Release() takes the file off the target (restoring
// the buffer it replaced when it is still on top), closes the file and
// deregisters. The destructor calls
// Release() as a fallback; explicit release is the intended use.
//
// Handles are stack scoped: release them in the reverse order of creation.
// Releasing an older handle first leaves the newer redirection active and
// only removes the older one from the target's stack, so the newer handle
// later restores what the older one had replaced. This is reported as a
// warning diagnostic, not an error.
class RedirectionHandle
{
 public:
  // Throws ValidationError for an unusable path and IoError when the
  // directory or the file cannot be created. Nothing stays registered when
  // construction fails.
  explicit RedirectionHandle(const std::string& file_path,
                             IOutputTarget& target = ConsoleOutput(),
                             RedirectionRegistry& registry = RedirectionRegistry::Instance());
  ~RedirectionHandle();

  RedirectionHandle(const RedirectionHandle&) = delete;
  RedirectionHandle& operator=(const RedirectionHandle&) = delete;

  // Canonical absolute path of the target file
  const std::string& FilePath() const { return path_; }
  bool IsActive() const { return active_.load(std::memory_order_acquire); }

  // Throws HandleReleasedError after Release(), IoError if the write fails
  void Flush();

  // On-disk size; 0 when the file is missing or the handle is released
  int64_t FileSize() const;

  // Idempotent; never throws
  void Release() noexcept;

  // The buffer this handle replaced, and its own file buffer
  std::streambuf* Previous() const { return previous_; }
  std::streambuf* Sink() const { return sink_.get(); }

 private:
  std::string path_;
  IOutputTarget& target_;
  RedirectionRegistry& registry_;
  std::unique_ptr<FileStreamBuf> sink_;
  std::streambuf* previous_ = nullptr;
  std::atomic<bool> active_{false};
  std::mutex release_mutex_;
};

}  // namespace con2file
