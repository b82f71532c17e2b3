#pragma once
#include <cstddef>

#include "../diag_entry.hpp"
#include "../log_level.hpp"

namespace con2file
{

class IDiagSink
{
 public:
  virtual ~IDiagSink() = default;

  // 写入一条诊断（在调用线程上同步执行）
  virtual void Write(const DiagEntry& entry) = 0;

  virtual void Flush() = 0;

  // 设置该 Sink 的最低输出级别（独立于全局级别）
  void SetLevel(LogLevel level) { min_level_ = level; }

  LogLevel Level() const { return min_level_; }

  bool ShouldLog(LogLevel entry_level) const { return entry_level >= min_level_; }

 protected:
  LogLevel min_level_ = LogLevel::Debug;

  // "[date time.us] [LEVEL] [tid:N] [file:line] msg", returns length without '\n'
  static size_t FormatLine(const DiagEntry& entry, char* buf, size_t buf_size);
};

}  // namespace con2file
