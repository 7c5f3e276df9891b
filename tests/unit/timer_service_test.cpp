#include "internal/upload/timer_service.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using voicecode::upload::ManualTimerService;
using voicecode::upload::ThreadTimerService;

void TestManualTimersFireInDeadlineOrder() {
  ManualTimerService timers;
  std::vector<int>   fired;

  timers.Schedule(300ms, [&] { fired.push_back(3); });
  timers.Schedule(100ms, [&] { fired.push_back(1); });
  const auto cancelled = timers.Schedule(150ms, [&] { fired.push_back(99); });
  timers.Schedule(200ms, [&] { fired.push_back(2); });

  assert(timers.Cancel(cancelled));
  assert(!timers.Cancel(cancelled));

  assert(timers.Advance(99ms) == 0);
  assert(fired.empty());

  assert(timers.Advance(101ms) == 2);
  assert((fired == std::vector<int>{1, 2}));
  assert(timers.PendingCount() == 1);

  assert(timers.Advance(1s) == 1);
  assert((fired == std::vector<int>{1, 2, 3}));
  assert(timers.Elapsed() == 1200ms);
}

void TestManualTimerScheduledFromCallbackFiresInSameAdvance() {
  ManualTimerService timers;
  int                fired = 0;

  timers.Schedule(10ms, [&] {
    ++fired;
    timers.Schedule(10ms, [&] { ++fired; });
  });

  assert(timers.Advance(25ms) == 2);
  assert(fired == 2);
}

void TestThreadTimerFiresAndCancels() {
  ThreadTimerService timers;

  std::mutex              mutex;
  std::condition_variable cv;
  bool                    fired = false;
  std::atomic<int>        cancelled_fired{0};

  const auto cancelled = timers.Schedule(50ms, [&] { ++cancelled_fired; });
  timers.Schedule(20ms, [&] {
    std::lock_guard lock(mutex);
    fired = true;
    cv.notify_all();
  });
  assert(timers.Cancel(cancelled));

  {
    std::unique_lock lock(mutex);
    assert(cv.wait_for(lock, 5s, [&] { return fired; }));
  }

  std::this_thread::sleep_for(100ms);
  assert(cancelled_fired == 0);
}

void TestThreadTimerShutdownDropsPending() {
  std::atomic<int> fired{0};
  {
    ThreadTimerService timers;
    timers.Schedule(10s, [&] { ++fired; });
    timers.Shutdown();
    timers.Shutdown();

    bool threw = false;
    try {
      timers.Schedule(1ms, [&] { ++fired; });
    } catch (const voicecode::util::InvalidState&) {
      threw = true;
    }
    assert(threw);
  }
  assert(fired == 0);
}

void TestConcurrentShutdownJoinsOnce() {
  for (int round = 0; round < 50; ++round) {
    ThreadTimerService timers;
    timers.Schedule(1ms, [] {});
    timers.Schedule(10s, [] {});

    std::atomic<bool>        go{false};
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
      threads.emplace_back([&] {
        while (!go) std::this_thread::yield();
        timers.Shutdown();
      });
    }
    go = true;
    for (auto& t : threads) t.join();

    timers.Shutdown();
  }
}

} // namespace

int main() {
  TestManualTimersFireInDeadlineOrder();
  TestManualTimerScheduledFromCallbackFiresInSameAdvance();
  TestThreadTimerFiresAndCancels();
  TestThreadTimerShutdownDropsPending();
  TestConcurrentShutdownJoinsOnce();

  std::cout << "voicecode_unit_timer_service: pass\n";
  return 0;
}
