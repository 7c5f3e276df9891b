#include "internal/upload/ack_coordinator.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using voicecode::session::v1::UploadFile;
using voicecode::session::v1::UploadFileResult;
using voicecode::upload::AckCoordinator;
using voicecode::upload::ManualTimerService;
using voicecode::upload::ThreadTimerService;
using voicecode::upload::Transport;
using voicecode::upload::UploadOutcome;
using voicecode::upload::UploadStatus;

class FakeTransport final : public Transport {
 public:
  bool IsConnected() const override {
    return connected;
  }

  void Send(const UploadFile& message) override {
    if (fail_send) throw std::runtime_error("socket closed");
    std::lock_guard lock(mutex_);
    sent_.push_back(message);
  }

  UploadFile Last() const {
    std::lock_guard lock(mutex_);
    return sent_.back();
  }

  std::size_t SentCount() const {
    std::lock_guard lock(mutex_);
    return sent_.size();
  }

  std::atomic<bool> connected{true};
  std::atomic<bool> fail_send{false};

 private:
  mutable std::mutex      mutex_;
  std::vector<UploadFile> sent_;
};

struct Fixture {
  std::shared_ptr<FakeTransport>      transport = std::make_shared<FakeTransport>();
  std::shared_ptr<ManualTimerService> timers    = std::make_shared<ManualTimerService>();
  AckCoordinator                      acks{transport, timers};

  std::future<UploadOutcome> Begin(const std::string& key, std::chrono::milliseconds timeout = 30s) {
    UploadFile payload;
    payload.set_filename(key);
    payload.set_content("bytes of " + key);
    payload.set_storage_location("~/Downloads");
    return acks.BeginRequest(key, payload, timeout);
  }
};

bool Ready(const std::future<UploadOutcome>& future) {
  return future.wait_for(0s) == std::future_status::ready;
}

UploadFileResult Response(const std::string& request_id, const std::string& filename, bool success, const std::string& error = "") {
  UploadFileResult result;
  result.set_request_id(request_id);
  result.set_filename(filename);
  result.set_success(success);
  result.set_error(error);
  return result;
}

void TestAcknowledgmentJustBeforeTimeoutWins() {
  Fixture f;
  auto    future = f.Begin("notes.txt");

  const auto sent = f.transport->Last();
  assert(!sent.request_id().empty());
  assert(sent.filename() == "notes.txt");

  f.timers->Advance(29900ms);
  assert(!Ready(future));

  assert(f.acks.HandleResponse(Response(sent.request_id(), "notes.txt", true)));
  assert(Ready(future));

  const auto outcome = future.get();
  assert(outcome.status == UploadStatus::kSucceeded);
  assert(outcome.key == "notes.txt");
  assert(outcome.resolved_name == "notes.txt");

  // the timeout was cancelled
  assert(f.timers->PendingCount() == 0);
  assert(f.timers->Advance(1s) == 0);
  assert(f.acks.PendingCount() == 0);
}

void TestTimeoutWinsAndLateAcknowledgmentIsDropped() {
  Fixture f;
  auto    future = f.Begin("notes.txt");
  const auto request_id = f.transport->Last().request_id();

  f.timers->Advance(30s);
  assert(Ready(future));
  assert(future.get().status == UploadStatus::kTimeout);
  assert(!f.acks.IsPending("notes.txt"));

  assert(!f.acks.HandleResponse(Response(request_id, "notes.txt", true)));
  assert(!f.acks.Resolve("notes.txt", UploadOutcome{}));
}

void TestDuplicateKeyIsRejectedWhilePending() {
  Fixture f;
  auto    first = f.Begin("a.png");

  bool threw = false;
  try {
    f.Begin("a.png");
  } catch (const voicecode::util::DuplicateKey&) {
    threw = true;
  }
  assert(threw);
  assert(f.transport->SentCount() == 1);

  assert(f.acks.Resolve("a.png", UploadOutcome{}));
  assert(first.get().status == UploadStatus::kSucceeded);

  // free again once resolved
  auto second = f.Begin("a.png");
  assert(f.acks.IsPending("a.png"));
  assert(f.transport->SentCount() == 2);
}

void TestRejectedAcknowledgment() {
  Fixture f;
  auto    future = f.Begin("big.bin");

  assert(f.acks.HandleResponse(Response(f.transport->Last().request_id(), "big.bin", false, "disk full")));
  const auto outcome = future.get();
  assert(outcome.status == UploadStatus::kRejected);
  assert(outcome.message == "disk full");
}

void TestExactKeyMatchWithoutRequestId() {
  Fixture f;
  auto    a = f.Begin("a.txt");
  auto    b = f.Begin("b.txt");

  assert(f.acks.HandleResponse(Response("", "b.txt", true)));
  assert(Ready(b));
  assert(!Ready(a));
  assert(f.acks.PendingCount() == 1);
}

void TestFallbackMatchesOnlyPendingRequest() {
  Fixture f;
  auto    future = f.Begin("report.pdf");

  // backend renamed the file to avoid a collision
  assert(f.acks.HandleResponse(Response("", "report-1.pdf", true)));
  const auto outcome = future.get();
  assert(outcome.status == UploadStatus::kSucceeded);
  assert(outcome.key == "report.pdf");
  assert(outcome.resolved_name == "report-1.pdf");
}

void TestFallbackIsAmbiguousWithSeveralOrNonePending() {
  Fixture f;
  assert(!f.acks.HandleResponse(Response("", "renamed.txt", true)));

  auto a = f.Begin("a.txt");
  auto b = f.Begin("b.txt");

  assert(!f.acks.HandleResponse(Response("", "renamed.txt", true)));
  assert(f.acks.PendingCount() == 2);
  assert(!Ready(a));
  assert(!Ready(b));
}

void TestEchoedRequestIdIsAuthoritative() {
  Fixture f;
  auto    first = f.Begin("a.txt", 1s);
  const auto stale_id = f.transport->Last().request_id();

  f.timers->Advance(1s);
  assert(first.get().status == UploadStatus::kTimeout);

  auto second = f.Begin("a.txt", 1s);
  assert(f.transport->Last().request_id() != stale_id);

  // the late acknowledgment of the first request must not complete the second
  assert(!f.acks.HandleResponse(Response(stale_id, "a.txt", true)));
  assert(f.acks.IsPending("a.txt"));
  assert(!Ready(second));
}

void TestSendFailureCompletesWithTransportFailure() {
  Fixture f;
  f.transport->fail_send = true;

  auto future = f.Begin("a.txt");
  assert(Ready(future));

  const auto outcome = future.get();
  assert(outcome.status == UploadStatus::kTransportFailure);
  assert(outcome.message == "socket closed");
  assert(!f.acks.IsPending("a.txt"));
  assert(f.timers->PendingCount() == 0);
}

void TestAbandonedEntryStillDrains() {
  Fixture f;
  auto    future = f.Begin("a.txt");

  assert(f.acks.Abandon("a.txt"));
  assert(!f.acks.Abandon("missing.txt"));
  assert(f.acks.IsPending("a.txt"));

  f.timers->Advance(30s);
  assert(!f.acks.IsPending("a.txt"));
  assert(f.acks.PendingCount() == 0);
}

void TestFailAllCompletesEverything() {
  Fixture f;
  auto    a = f.Begin("a.txt");
  auto    b = f.Begin("b.txt");

  assert(f.acks.FailAll("connection lost") == 2);
  assert(a.get().status == UploadStatus::kTransportFailure);

  const auto outcome = b.get();
  assert(outcome.status == UploadStatus::kTransportFailure);
  assert(outcome.message == "connection lost");
  assert(f.timers->PendingCount() == 0);
  assert(f.acks.FailAll("again") == 0);
}

void TestConcurrentResolversResolveOnce() {
  Fixture f;
  auto    future = f.Begin("race.txt");

  std::atomic<int>         winners{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      if (f.acks.Resolve("race.txt", UploadOutcome{})) ++winners;
    });
  }
  for (auto& t : threads) t.join();

  assert(winners == 1);
  assert(future.get().status == UploadStatus::kSucceeded);
}

void TestResolveRacingRealTimeoutCompletesExactlyOnce() {
  auto transport = std::make_shared<FakeTransport>();
  auto timers    = std::make_shared<ThreadTimerService>();

  int resolved_by_ack     = 0;
  int resolved_by_timeout = 0;

  {
    AckCoordinator acks(transport, timers);

    for (int i = 0; i < 200; ++i) {
      const auto key = "race-" + std::to_string(i) + ".txt";

      UploadFile payload;
      payload.set_filename(key);
      auto future = acks.BeginRequest(key, payload, std::chrono::milliseconds(1));

      // land the acknowledgment around the deadline
      std::this_thread::sleep_for(std::chrono::microseconds((i % 5) * 400));
      const bool acked = acks.Resolve(key, UploadOutcome{});

      const auto status = future.wait_for(5s);
      assert(status == std::future_status::ready);
      const auto outcome = future.get();

      if (acked) {
        assert(outcome.status == UploadStatus::kSucceeded);
        ++resolved_by_ack;
      } else {
        assert(outcome.status == UploadStatus::kTimeout);
        ++resolved_by_timeout;
      }
      assert(!acks.IsPending(key));
    }
  }

  timers->Shutdown();
  assert(resolved_by_ack + resolved_by_timeout == 200);
}

} // namespace

int main() {
  TestAcknowledgmentJustBeforeTimeoutWins();
  TestTimeoutWinsAndLateAcknowledgmentIsDropped();
  TestDuplicateKeyIsRejectedWhilePending();
  TestRejectedAcknowledgment();
  TestExactKeyMatchWithoutRequestId();
  TestFallbackMatchesOnlyPendingRequest();
  TestFallbackIsAmbiguousWithSeveralOrNonePending();
  TestEchoedRequestIdIsAuthoritative();
  TestSendFailureCompletesWithTransportFailure();
  TestAbandonedEntryStillDrains();
  TestFailAllCompletesEverything();
  TestConcurrentResolversResolveOnce();
  TestResolveRacingRealTimeoutCompletesExactlyOnce();

  std::cout << "voicecode_unit_ack_coordinator: pass\n";
  return 0;
}
