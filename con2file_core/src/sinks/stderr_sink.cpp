#include "con2file/sinks/stderr_sink.hpp"

#include <unistd.h>

#include <cerrno>

namespace con2file
{

StderrSink::StderrSink(LogLevel level) { SetLevel(level); }

void StderrSink::Write(const DiagEntry& entry)
{
  if (!ShouldLog(entry.level))
  {
    return;
  }

  std::lock_guard<std::mutex> lock(write_mutex_);
  size_t len = FormatLine(entry, format_buf_, sizeof(format_buf_) - 1);
  if (len == 0)
  {
    return;
  }
  format_buf_[len++] = '\n';

  size_t off = 0;
  while (off < len)
  {
    ssize_t written = ::write(STDERR_FILENO, format_buf_ + off, len - off);
    if (written < 0)
    {
      if (errno == EINTR) continue;
      return;
    }
    off += static_cast<size_t>(written);
  }
}

void StderrSink::Flush() {}

}  // namespace con2file
