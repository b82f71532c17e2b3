#pragma once
#include <functional>

#include "sink_interface.hpp"

namespace con2file
{

class CallbackSink : public IDiagSink
{
 public:
  using Callback = std::function<void(const DiagEntry&)>;

  explicit CallbackSink(Callback cb);

  void Write(const DiagEntry& entry) override;
  void Flush() override;

 private:
  Callback callback_;
};

}  // namespace con2file
