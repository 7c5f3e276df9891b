#include "timer_service.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace voicecode::upload {

using voicecode::observability::IntField;
using voicecode::observability::StringField;

namespace {

void Fire(TimerId id, const TimerCallback& callback) {
  try {
    callback();
  } catch (const std::exception& e) {
    VOICECODE_LOG_ERROR("timer callback failed", {IntField("timer_id", static_cast<int64_t>(id)), StringField("error", e.what())});
  }
}

} // namespace

// ------------------------------------------------------------
// ThreadTimerService
// ------------------------------------------------------------

ThreadTimerService::ThreadTimerService() : thread_(&ThreadTimerService::Run, this) {
}

ThreadTimerService::~ThreadTimerService() {
  Shutdown();
}

TimerId ThreadTimerService::Schedule(std::chrono::milliseconds delay, TimerCallback callback) {
  TimerId id;
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      throw voicecode::util::InvalidState("timer service is shut down");
    }
    id                  = next_id_++;
    const auto deadline = std::chrono::steady_clock::now() + delay;
    timers_.emplace(Key{deadline, id}, std::move(callback));
    deadlines_.emplace(id, deadline);
  }
  cv_.notify_one();
  return id;
}

bool ThreadTimerService::Cancel(TimerId id) {
  std::lock_guard lock(mutex_);
  auto it = deadlines_.find(id);
  if (it == deadlines_.end()) return false;

  timers_.erase(Key{it->second, id});
  deadlines_.erase(it);
  return true;
}

void ThreadTimerService::Shutdown() {
  std::thread worker;
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
    timers_.clear();
    deadlines_.clear();
    // exactly one caller takes the worker; a callback shutting down its own thread never joins
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) worker = std::move(thread_);
  }
  cv_.notify_all();
  if (worker.joinable()) worker.join();
}

void ThreadTimerService::Run() {
  std::unique_lock lock(mutex_);
  while (!shutdown_) {
    if (timers_.empty()) {
      cv_.wait(lock, [&] { return shutdown_ || !timers_.empty(); });
      continue;
    }

    const auto next = timers_.begin()->first.first;
    if (std::chrono::steady_clock::now() < next) {
      cv_.wait_until(lock, next);
      continue;
    }

    auto node = timers_.extract(timers_.begin());
    const auto id = node.key().second;
    deadlines_.erase(id);

    lock.unlock();
    Fire(id, node.mapped());
    lock.lock();
  }
}

// ------------------------------------------------------------
// ManualTimerService
// ------------------------------------------------------------

TimerId ManualTimerService::Schedule(std::chrono::milliseconds delay, TimerCallback callback) {
  std::lock_guard lock(mutex_);
  const auto id       = next_id_++;
  const auto deadline = now_ + delay;
  timers_.emplace(Key{deadline, id}, std::move(callback));
  deadlines_.emplace(id, deadline);
  return id;
}

bool ManualTimerService::Cancel(TimerId id) {
  std::lock_guard lock(mutex_);
  auto it = deadlines_.find(id);
  if (it == deadlines_.end()) return false;

  timers_.erase(Key{it->second, id});
  deadlines_.erase(it);
  return true;
}

std::size_t ManualTimerService::Advance(std::chrono::milliseconds delta) {
  std::size_t fired = 0;

  std::unique_lock lock(mutex_);
  const auto target = now_ + delta;

  // callbacks may schedule or cancel; re-check the head after each one
  while (!timers_.empty() && timers_.begin()->first.first <= target) {
    auto node = timers_.extract(timers_.begin());
    const auto id = node.key().second;
    now_          = node.key().first;
    deadlines_.erase(id);

    lock.unlock();
    Fire(id, node.mapped());
    ++fired;
    lock.lock();
  }

  now_ = target;
  return fired;
}

std::chrono::milliseconds ManualTimerService::Elapsed() const {
  std::lock_guard lock(mutex_);
  return now_;
}

std::size_t ManualTimerService::PendingCount() const {
  std::lock_guard lock(mutex_);
  return timers_.size();
}

} // namespace voicecode::upload
