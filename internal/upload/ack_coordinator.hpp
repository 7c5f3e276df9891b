#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "timer_service.hpp"
#include "transport.hpp"
#include "voicecode/session/v1.hpp"

namespace voicecode::upload {

enum class UploadStatus { kSucceeded, kRejected, kTimeout, kTransportFailure };

const char* ToString(UploadStatus status);

struct UploadOutcome {
  UploadStatus status = UploadStatus::kSucceeded;

  // Key the request was registered under.
  std::string key;

  // Name the backend stored the resource as; may differ from key.
  std::string resolved_name;

  std::string message;
};

/*
  Matches asynchronous acknowledgments to the requests awaiting them.

  Every pending request is completed exactly once, by whichever of
  acknowledgment, timeout or transport failure takes its entry out of the
  table first. All of them go through one take primitive under one mutex;
  the loser finds nothing and does nothing.

  Promises are fulfilled and timers cancelled after the mutex is released.
*/
class AckCoordinator {
 public:
  AckCoordinator(std::shared_ptr<Transport> transport, std::shared_ptr<TimerService> timers);

  // Pending requests complete with kTransportFailure.
  ~AckCoordinator();

  AckCoordinator(const AckCoordinator&)            = delete;
  AckCoordinator& operator=(const AckCoordinator&) = delete;

  // Registers the request, arms its timeout and sends the payload with a
  // fresh request_id. Throws util::DuplicateKey if key is already pending.
  std::future<UploadOutcome> BeginRequest(const std::string& key, voicecode::session::v1::UploadFile payload,
                                          std::chrono::milliseconds timeout);

  // False when nothing matched (late or unknown acknowledgment).
  bool Resolve(const std::string& key, UploadOutcome outcome);
  bool ResolveByRequestId(const std::string& request_id, UploadOutcome outcome);

  // Resolves the only pending request; ambiguous otherwise.
  bool ResolveByFallbackMatch(UploadOutcome outcome);

  // Inbound acknowledgment: request id, then filename, then fallback.
  bool HandleResponse(const voicecode::session::v1::UploadFileResult& result);

  // The caller stops waiting. The entry still drains through acknowledgment
  // or timeout; its outcome is logged and discarded.
  bool Abandon(const std::string& key);

  // Completes every pending request with kTransportFailure.
  std::size_t FailAll(const std::string& reason);

  std::size_t PendingCount() const;
  bool        IsPending(const std::string& key) const;

 private:
  struct Pending {
    std::string                  key;
    std::string                  request_id;
    std::promise<UploadOutcome>  promise;
    std::optional<TimerId>       timer;
    uint64_t                     created_seq = 0;
    bool                         abandoned   = false;
  };

  // Shared with timer callbacks so a late timer never touches a destroyed
  // coordinator.
  struct Table {
    mutable std::mutex                           mutex;
    std::unordered_map<std::string, Pending>     by_key;
    std::unordered_map<std::string, std::string> key_by_request;
    uint64_t                                     next_seq = 0;

    std::optional<Pending> TakeLocked(const std::string& key);
    std::optional<Pending> TakeByRequestLocked(const std::string& request_id);
  };

  static void OnTimeout(const std::shared_ptr<Table>& table, const std::string& request_id);

  // Cancels the timer (unless it is the one firing) and fulfils the promise.
  void Complete(Pending pending, UploadOutcome outcome);

  static void Deliver(Pending& pending, UploadOutcome outcome);

  std::shared_ptr<Transport>    transport_;
  std::shared_ptr<TimerService> timers_;
  std::shared_ptr<Table>        table_;
};

} // namespace voicecode::upload
