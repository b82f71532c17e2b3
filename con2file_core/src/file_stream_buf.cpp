#include "con2file/file_stream_buf.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>

#include "con2file/error.hpp"

namespace con2file
{

std::unique_ptr<FileStreamBuf> FileStreamBuf::Open(const std::string& path)
{
  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
  if (fd < 0)
  {
    throw IoError("open", path, errno);
  }
  return std::unique_ptr<FileStreamBuf>(new FileStreamBuf(path, fd));
}

FileStreamBuf::FileStreamBuf(std::string path, int fd) : path_(std::move(path)), fd_(fd)
{
  pending_.reserve(C2F_FILE_BUF_SIZE);
}

FileStreamBuf::~FileStreamBuf() { Close(); }

bool FileStreamBuf::IsOpen() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return fd_ >= 0;
}

int FileStreamBuf::WriteOutLocked()
{
  if (fd_ < 0)
  {
    bool dropped = !pending_.empty();
    pending_.clear();
    return dropped ? EBADF : 0;
  }

  size_t off = 0;
  while (off < pending_.size())
  {
    ssize_t written = ::write(fd_, pending_.data() + off, pending_.size() - off);
    if (written < 0)
    {
      if (errno == EINTR) continue;
      int err = errno;
      pending_.erase(0, off);
      return err;
    }
    off += static_cast<size_t>(written);
  }
  pending_.clear();
  return 0;
}

int FileStreamBuf::Flush()
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (fd_ < 0)
  {
    return EBADF;
  }
  int err = WriteOutLocked();
  if (err != 0)
  {
    return err;
  }
#if defined(C2F_PLATFORM_LINUX)
  if (::fdatasync(fd_) != 0)
#else
  if (::fsync(fd_) != 0)
#endif
  {
    return errno;
  }
  return 0;
}

int FileStreamBuf::Close()
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (fd_ < 0)
  {
    return 0;
  }

  int err = WriteOutLocked();
  if (::fsync(fd_) != 0 && err == 0)
  {
    err = errno;
  }
  if (::close(fd_) != 0 && err == 0)
  {
    err = errno;
  }
  fd_ = -1;
  return err;
}

FileStreamBuf::int_type FileStreamBuf::overflow(int_type ch)
{
  if (traits_type::eq_int_type(ch, traits_type::eof()))
  {
    return traits_type::not_eof(ch);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (fd_ < 0)
  {
    return traits_type::eof();
  }
  pending_.push_back(traits_type::to_char_type(ch));
  if (pending_.size() >= C2F_FILE_BUF_SIZE && WriteOutLocked() != 0)
  {
    return traits_type::eof();
  }
  return ch;
}

std::streamsize FileStreamBuf::xsputn(const char* s, std::streamsize n)
{
  if (n <= 0)
  {
    return 0;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (fd_ < 0)
  {
    return 0;
  }
  pending_.append(s, static_cast<size_t>(n));
  if (pending_.size() >= C2F_FILE_BUF_SIZE && WriteOutLocked() != 0)
  {
    return 0;
  }
  return n;
}

int FileStreamBuf::sync()
{
  std::lock_guard<std::mutex> lock(mutex_);
  return WriteOutLocked() == 0 ? 0 : -1;
}

}  // namespace con2file
