#pragma once
#include <fmt/format.h>

#include <atomic>
#include <cstring>
#include <memory>
#include <shared_mutex>
#include <vector>

#include "diag_entry.hpp"
#include "log_level.hpp"
#include "sinks/sink_interface.hpp"
#include "source_location.hpp"
#include "timestamp.hpp"

namespace con2file
{

// Internal diagnostics channel. Records are delivered synchronously on the
// calling thread; the default configuration is a single StderrSink at Warn.
class Diagnostics
{
 public:
  static Diagnostics& Instance();

  void AddSink(std::unique_ptr<IDiagSink> sink);
  // Drops every sink, including the default stderr one
  void ClearSinks();
  // Back to the default stderr sink
  void ResetSinks();

  void SetLevel(LogLevel level);
  LogLevel Level() const;

  void Flush();

  template <typename... Args>
  void LogImpl(LogLevel level, const SourceLocation& loc, const char* fmt_str,
               Args&&... args);

 private:
  Diagnostics();

  static uint32_t CurrentThreadId();
  void Dispatch(const DiagEntry& entry);

  mutable std::shared_mutex sinks_mutex_;
  std::vector<std::unique_ptr<IDiagSink>> sinks_;
  std::atomic<LogLevel> level_{LogLevel::Info};
};

// ===== LogImpl template implementation =====

template <typename... Args>
void Diagnostics::LogImpl(LogLevel level, const SourceLocation& loc, const char* fmt_str,
                          Args&&... args)
{
  DiagEntry entry{};

  entry.wall_clock_ns = wall_clock_now_ns();
  entry.level = level;
  entry.file_name = loc.file_name;
  entry.function_name = loc.function_name;
  entry.line = loc.line;
  entry.thread_id = CurrentThreadId();

  // A malformed pattern must not turn a diagnostic into an exception
  try
  {
    auto result = fmt::format_to_n(entry.msg, C2F_MAX_MSG_LEN - 1, fmt::runtime(fmt_str),
                                   std::forward<Args>(args)...);
    entry.msg_len = static_cast<uint16_t>(
        result.size < C2F_MAX_MSG_LEN - 1 ? result.size : C2F_MAX_MSG_LEN - 1);
  }
  catch (const fmt::format_error&)
  {
    std::strncpy(entry.msg, fmt_str, C2F_MAX_MSG_LEN - 1);
    entry.msg_len = static_cast<uint16_t>(std::strlen(entry.msg));
  }
  entry.msg[entry.msg_len] = '\0';

  Dispatch(entry);
}

}  // namespace con2file

// ===== Diagnostics macros =====

#define C2F_LOG_CALL(lvl, fmt_str, ...)                                       \
  do                                                                          \
  {                                                                           \
    constexpr auto _c2f_lvl = ::con2file::LogLevel::lvl;                      \
    if (static_cast<int>(_c2f_lvl) >= C2F_ACTIVE_LEVEL)                       \
    {                                                                         \
      auto& _c2f_diag = ::con2file::Diagnostics::Instance();                  \
      if (_c2f_lvl >= _c2f_diag.Level())                                      \
      {                                                                       \
        _c2f_diag.LogImpl(_c2f_lvl, C2F_CURRENT_LOCATION(), fmt_str, ##__VA_ARGS__); \
      }                                                                       \
    }                                                                         \
  } while (0)

#define C2F_LOG_DEBUG(fmt, ...) C2F_LOG_CALL(Debug, fmt, ##__VA_ARGS__)
#define C2F_LOG_INFO(fmt, ...) C2F_LOG_CALL(Info, fmt, ##__VA_ARGS__)
#define C2F_LOG_WARN(fmt, ...) C2F_LOG_CALL(Warn, fmt, ##__VA_ARGS__)
#define C2F_LOG_ERROR(fmt, ...) C2F_LOG_CALL(Error, fmt, ##__VA_ARGS__)
