#pragma once
#include <mutex>

#include "sink_interface.hpp"

namespace con2file
{

// Writes straight to file descriptor 2 so diagnostics never end up inside a
// redirected std::cout.
class StderrSink : public IDiagSink
{
 public:
  explicit StderrSink(LogLevel level = LogLevel::Warn);

  void Write(const DiagEntry& entry) override;
  void Flush() override;

 private:
  std::mutex write_mutex_;
  char format_buf_[C2F_MAX_MSG_LEN + 256];
};

}  // namespace con2file
