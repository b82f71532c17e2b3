#include "con2file/diagnostics.hpp"

#include <mutex>

#include "con2file/sinks/stderr_sink.hpp"

#if defined(C2F_PLATFORM_LINUX)
#include <sys/syscall.h>
#include <unistd.h>
#elif defined(C2F_PLATFORM_MACOS)
#include <pthread.h>
#endif

namespace con2file
{

Diagnostics& Diagnostics::Instance()
{
  static Diagnostics inst;
  return inst;
}

Diagnostics::Diagnostics() { sinks_.push_back(std::make_unique<StderrSink>()); }

void Diagnostics::AddSink(std::unique_ptr<IDiagSink> sink)
{
  if (!sink) return;
  std::unique_lock<std::shared_mutex> lock(sinks_mutex_);
  sinks_.push_back(std::move(sink));
}

void Diagnostics::ClearSinks()
{
  std::unique_lock<std::shared_mutex> lock(sinks_mutex_);
  sinks_.clear();
}

void Diagnostics::ResetSinks()
{
  std::unique_lock<std::shared_mutex> lock(sinks_mutex_);
  sinks_.clear();
  sinks_.push_back(std::make_unique<StderrSink>());
}

void Diagnostics::SetLevel(LogLevel level) { level_.store(level, std::memory_order_relaxed); }

LogLevel Diagnostics::Level() const { return level_.load(std::memory_order_relaxed); }

void Diagnostics::Flush()
{
  std::shared_lock<std::shared_mutex> lock(sinks_mutex_);
  for (auto& sink : sinks_)
  {
    sink->Flush();
  }
}

uint32_t Diagnostics::CurrentThreadId()
{
  thread_local uint32_t tid = 0;
  if (tid == 0)
  {
#if defined(C2F_PLATFORM_LINUX)
    tid = static_cast<uint32_t>(::syscall(SYS_gettid));
#elif defined(C2F_PLATFORM_MACOS)
    uint64_t id = 0;
    pthread_threadid_np(nullptr, &id);
    tid = static_cast<uint32_t>(id);
#endif
  }
  return tid;
}

void Diagnostics::Dispatch(const DiagEntry& entry)
{
  std::shared_lock<std::shared_mutex> lock(sinks_mutex_);
  for (auto& sink : sinks_)
  {
    if (sink->ShouldLog(entry.level))
    {
      sink->Write(entry);
    }
  }
}

}  // namespace con2file
