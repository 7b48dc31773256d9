#include "stop_signals.hpp"

#include <gtest/gtest.h>

#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <future>

using namespace floword;

TEST(StopSignalWatcherTest, RunsCallbackOnSigterm) {
  std::promise<int> received;
  auto fut = received.get_future();
  StopSignalWatcher watcher;
  watcher.Start([&](int sig) { received.set_value(sig); });

  ASSERT_EQ(::kill(::getpid(), SIGTERM), 0);
  ASSERT_EQ(fut.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_EQ(fut.get(), SIGTERM);
  EXPECT_TRUE(watcher.Triggered());
  watcher.Stop();
}

TEST(StopSignalWatcherTest, StopWithoutSignalSkipsCallback) {
  std::atomic<bool> called{false};
  StopSignalWatcher watcher;
  watcher.Start([&](int) { called = true; });
  watcher.Stop();
  EXPECT_FALSE(called);
  EXPECT_FALSE(watcher.Triggered());
  // Stopping twice is harmless.
  watcher.Stop();
}
