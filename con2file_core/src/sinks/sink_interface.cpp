#include "con2file/sinks/sink_interface.hpp"

#include <cstdio>

#include "con2file/timestamp.hpp"

namespace con2file
{

size_t IDiagSink::FormatLine(const DiagEntry& entry, char* buf, size_t buf_size)
{
  if (buf_size == 0) return 0;

  char ts[40];
  format_timestamp(entry.wall_clock_ns, ts, sizeof(ts));
  std::string_view level = to_string(entry.level);

  int n = std::snprintf(buf, buf_size, "[%s] [%.*s] [tid:%u] [%s:%u] %.*s", ts,
                        static_cast<int>(level.size()), level.data(), entry.thread_id,
                        entry.file_name ? entry.file_name : "?", entry.line,
                        static_cast<int>(entry.msg_len), entry.msg);
  if (n < 0) return 0;
  return static_cast<size_t>(n) < buf_size ? static_cast<size_t>(n) : buf_size - 1;
}

}  // namespace con2file
