#include "stop_signals.hpp"

#include <iostream>
#include <utility>

namespace floword {

StopSignalWatcher::StopSignalWatcher() {
  sigemptyset(&signals_);
  sigaddset(&signals_, SIGINT);
  sigaddset(&signals_, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals_, &previous_);
}

StopSignalWatcher::~StopSignalWatcher() {
  Stop();
  pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
}

void StopSignalWatcher::Stop() {
  if (waiter_.joinable()) {
    stopping_ = true;
    // Wakes a waiter still blocked in sigwait.
    if (!triggered_) pthread_kill(waiter_.native_handle(), SIGTERM);
    waiter_.join();
  }
}

void StopSignalWatcher::Start(std::function<void(int)> on_signal) {
  waiter_ = std::thread([this, on_signal = std::move(on_signal)]() {
    int sig = 0;
    if (sigwait(&signals_, &sig) != 0) return;
    if (stopping_) return;
    triggered_ = true;
    std::cout << "[runtime] signal=" << sig << " stopping\n";
    if (on_signal) on_signal(sig);
  });
}

}  // namespace floword
