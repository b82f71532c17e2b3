#pragma once
#include <memory>
#include <mutex>
#include <streambuf>
#include <string>

#include "platform.hpp"

namespace con2file
{

// Append-only streambuf over a POSIX file descriptor.
//
// There is no put area: every character reaches overflow()/xsputn(), which
// buffer internally under a mutex, so several threads writing through one
// std::ostream cannot corrupt the buffer. The file is opened with O_APPEND,
// which lets other handles and processes append to the same file.
class FileStreamBuf : public std::streambuf
{
 public:
  // Throws IoError when the file cannot be opened for append
  static std::unique_ptr<FileStreamBuf> Open(const std::string& path);

  ~FileStreamBuf() override;

  FileStreamBuf(const FileStreamBuf&) = delete;
  FileStreamBuf& operator=(const FileStreamBuf&) = delete;

  // Writes out the buffer and fdatasync()s; returns 0 or errno
  int Flush();
  // Flush + close; later writes fail. Returns 0 or the first errno seen.
  int Close();

  bool IsOpen() const;
  const std::string& Path() const { return path_; }

 protected:
  int_type overflow(int_type ch) override;
  std::streamsize xsputn(const char* s, std::streamsize n) override;
  int sync() override;

 private:
  FileStreamBuf(std::string path, int fd);

  int WriteOutLocked();

  std::string path_;
  int fd_;
  std::string pending_;
  mutable std::mutex mutex_;
};

}  // namespace con2file
