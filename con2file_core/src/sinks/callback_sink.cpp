#include "con2file/sinks/callback_sink.hpp"

namespace con2file
{

CallbackSink::CallbackSink(Callback cb) : callback_(std::move(cb)) {}

void CallbackSink::Write(const DiagEntry& entry)
{
  if (!ShouldLog(entry.level))
  {
    return;
  }
  if (callback_)
  {
    callback_(entry);
  }
}

void CallbackSink::Flush() {}

}  // namespace con2file
