#pragma once
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace con2file
{

// Shared cancellation flag; copies observe the same state
class CancelToken
{
 public:
  CancelToken() : state_(std::make_shared<State>()) {}

  void Cancel()
  {
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      state_->cancelled = true;
    }
    state_->cv.notify_all();
  }

  bool IsCancelled() const
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
  }

  // Sleeps until `timeout` elapses or Cancel() is called; true if cancelled
  template <typename Rep, typename Period>
  bool WaitFor(std::chrono::duration<Rep, Period> timeout) const
  {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout, [this] { return state_->cancelled; });
  }

 private:
  struct State
  {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled = false;
  };

  std::shared_ptr<State> state_;
};

}  // namespace con2file
