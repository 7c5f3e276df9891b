#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace voicecode::upload {

using TimerId       = uint64_t;
using TimerCallback = std::function<void()>;

/*
  Deadline scheduling seam.

  Callbacks run on a thread owned by the implementation (or the caller of
  Advance for the manual clock) and never under a lock the caller holds.
  Cancel of an already fired or unknown id is a no-op.
*/
class TimerService {
 public:
  virtual ~TimerService() = default;

  virtual TimerId Schedule(std::chrono::milliseconds delay, TimerCallback callback) = 0;

  // True if the timer was still pending.
  virtual bool Cancel(TimerId id) = 0;
};

/*
  One worker thread waiting on the earliest deadline.
*/
class ThreadTimerService final : public TimerService {
 public:
  ThreadTimerService();
  ~ThreadTimerService() override;

  ThreadTimerService(const ThreadTimerService&)            = delete;
  ThreadTimerService& operator=(const ThreadTimerService&) = delete;

  TimerId Schedule(std::chrono::milliseconds delay, TimerCallback callback) override;
  bool    Cancel(TimerId id) override;

  // Stops the worker; unfired timers are dropped. Idempotent. Schedule
  // throws util::InvalidState afterwards.
  void Shutdown();

 private:
  using Deadline = std::chrono::steady_clock::time_point;
  using Key      = std::pair<Deadline, TimerId>;

  void Run();

  std::mutex                     mutex_;
  std::condition_variable        cv_;
  std::map<Key, TimerCallback>   timers_;
  std::map<TimerId, Deadline>    deadlines_;
  TimerId                        next_id_  = 1;
  bool                           shutdown_ = false;

  std::thread thread_;
};

/*
  Virtual clock for tests and deterministic drivers.
*/
class ManualTimerService final : public TimerService {
 public:
  TimerId Schedule(std::chrono::milliseconds delay, TimerCallback callback) override;
  bool    Cancel(TimerId id) override;

  // Moves the clock forward and fires every timer that became due, in
  // deadline order, on the calling thread. Returns how many fired.
  std::size_t Advance(std::chrono::milliseconds delta);

  std::chrono::milliseconds Elapsed() const;
  std::size_t               PendingCount() const;

 private:
  using Key = std::pair<std::chrono::milliseconds, TimerId>;

  mutable std::mutex                         mutex_;
  std::chrono::milliseconds                  now_{0};
  std::map<Key, TimerCallback>               timers_;
  std::map<TimerId, std::chrono::milliseconds> deadlines_;
  TimerId                                    next_id_ = 1;
};

} // namespace voicecode::upload
