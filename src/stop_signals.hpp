#pragma once

#include <pthread.h>
#include <signal.h>

#include <atomic>
#include <functional>
#include <thread>

namespace floword {

// Blocks SIGINT and SIGTERM in the constructing thread, so every thread it starts afterwards inherits the mask, and
// runs the callback on a dedicated thread when one of them arrives. The destructor stops the waiter and restores the
// previous mask.
class StopSignalWatcher {
 public:
  StopSignalWatcher();
  ~StopSignalWatcher();

  StopSignalWatcher(const StopSignalWatcher&) = delete;
  StopSignalWatcher& operator=(const StopSignalWatcher&) = delete;

  void Start(std::function<void(int)> on_signal);
  // Joins the waiter without running the callback. Signals stay blocked until destruction.
  void Stop();
  bool Triggered() const { return triggered_; }

 private:
  sigset_t signals_;
  sigset_t previous_;
  std::thread waiter_;
  std::atomic<bool> triggered_{false};
  std::atomic<bool> stopping_{false};
};

}  // namespace floword
