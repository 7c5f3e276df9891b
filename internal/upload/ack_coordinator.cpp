#include "ack_coordinator.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace voicecode::upload {

using voicecode::observability::IntField;
using voicecode::observability::StringField;

const char* ToString(UploadStatus status) {
  switch (status) {
    case UploadStatus::kSucceeded:        return "succeeded";
    case UploadStatus::kRejected:         return "rejected";
    case UploadStatus::kTimeout:          return "timeout";
    case UploadStatus::kTransportFailure: return "transport_failure";
  }
  return "unknown";
}

// ------------------------------------------------------------
// Table
// ------------------------------------------------------------

std::optional<AckCoordinator::Pending> AckCoordinator::Table::TakeLocked(const std::string& key) {
  auto it = by_key.find(key);
  if (it == by_key.end()) return std::nullopt;

  Pending pending = std::move(it->second);
  by_key.erase(it);
  key_by_request.erase(pending.request_id);
  return pending;
}

std::optional<AckCoordinator::Pending> AckCoordinator::Table::TakeByRequestLocked(const std::string& request_id) {
  auto it = key_by_request.find(request_id);
  if (it == key_by_request.end()) return std::nullopt;

  const auto key = it->second;
  return TakeLocked(key);
}

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------

AckCoordinator::AckCoordinator(std::shared_ptr<Transport> transport, std::shared_ptr<TimerService> timers)
    : transport_(std::move(transport)), timers_(std::move(timers)), table_(std::make_shared<Table>()) {
  if (!transport_ || !timers_) {
    throw std::invalid_argument("AckCoordinator requires a transport and a timer service");
  }
}

AckCoordinator::~AckCoordinator() {
  FailAll("upload coordinator shut down");
}

// ------------------------------------------------------------
// Completion
// ------------------------------------------------------------

void AckCoordinator::Deliver(Pending& pending, UploadOutcome outcome) {
  outcome.key = pending.key;
  if (outcome.resolved_name.empty() && outcome.status == UploadStatus::kSucceeded) {
    outcome.resolved_name = pending.key;
  }

  if (pending.abandoned) {
    VOICECODE_LOG_INFO("discarding outcome of abandoned upload",
                       {StringField("key", pending.key), StringField("request_id", pending.request_id), StringField("status", ToString(outcome.status))});
    return;
  }

  VOICECODE_LOG_DEBUG("upload completed", {StringField("key", pending.key), StringField("request_id", pending.request_id),
                                           StringField("status", ToString(outcome.status)), StringField("resolved_name", outcome.resolved_name)});
  pending.promise.set_value(std::move(outcome));
}

void AckCoordinator::Complete(Pending pending, UploadOutcome outcome) {
  if (pending.timer) timers_->Cancel(*pending.timer);
  Deliver(pending, std::move(outcome));
}

void AckCoordinator::OnTimeout(const std::shared_ptr<Table>& table, const std::string& request_id) {
  std::optional<Pending> pending;
  {
    std::lock_guard lock(table->mutex);
    pending = table->TakeByRequestLocked(request_id);
  }
  if (!pending) return;

  VOICECODE_LOG_WARN("upload acknowledgment timed out", {StringField("key", pending->key), StringField("request_id", request_id)});

  UploadOutcome outcome;
  outcome.status  = UploadStatus::kTimeout;
  outcome.message = "Upload timed out";
  Deliver(*pending, std::move(outcome));
}

// ------------------------------------------------------------
// Dispatch
// ------------------------------------------------------------

std::future<UploadOutcome> AckCoordinator::BeginRequest(const std::string& key, voicecode::session::v1::UploadFile payload,
                                                        std::chrono::milliseconds timeout) {
  if (key.empty()) {
    throw std::invalid_argument("upload key must not be empty");
  }

  const auto request_id = voicecode::util::GenerateUUIDString();
  payload.set_request_id(request_id);
  if (payload.filename().empty()) payload.set_filename(key);

  std::future<UploadOutcome> future;
  {
    std::lock_guard lock(table_->mutex);
    if (table_->by_key.count(key)) {
      throw voicecode::util::DuplicateKey("upload already pending for key: " + key);
    }

    Pending pending;
    pending.key         = key;
    pending.request_id  = request_id;
    pending.created_seq = table_->next_seq++;
    future              = pending.promise.get_future();

    // Schedule never runs the callback inline, so arming under the lock is safe.
    std::weak_ptr<Table> weak = table_;
    pending.timer = timers_->Schedule(timeout, [weak, request_id] {
      if (auto table = weak.lock()) OnTimeout(table, request_id);
    });

    table_->key_by_request.emplace(request_id, key);
    table_->by_key.emplace(key, std::move(pending));
  }

  VOICECODE_LOG_INFO("upload dispatched", {StringField("key", key), StringField("request_id", request_id),
                                           IntField("bytes", static_cast<int64_t>(payload.content().size())),
                                           IntField("timeout_ms", static_cast<int64_t>(timeout.count()))});

  try {
    transport_->Send(payload);
  } catch (const std::exception& e) {
    VOICECODE_LOG_ERROR("upload send failed", {StringField("key", key), StringField("request_id", request_id), StringField("error", e.what())});

    std::optional<Pending> pending;
    {
      std::lock_guard lock(table_->mutex);
      pending = table_->TakeByRequestLocked(request_id);
    }
    if (pending) {
      UploadOutcome outcome;
      outcome.status  = UploadStatus::kTransportFailure;
      outcome.message = e.what();
      Complete(std::move(*pending), std::move(outcome));
    }
  }

  return future;
}

// ------------------------------------------------------------
// Resolution
// ------------------------------------------------------------

bool AckCoordinator::Resolve(const std::string& key, UploadOutcome outcome) {
  std::optional<Pending> pending;
  {
    std::lock_guard lock(table_->mutex);
    pending = table_->TakeLocked(key);
  }

  if (!pending) {
    VOICECODE_LOG_DEBUG("acknowledgment for unknown or completed upload", {StringField("key", key)});
    return false;
  }

  Complete(std::move(*pending), std::move(outcome));
  return true;
}

bool AckCoordinator::ResolveByRequestId(const std::string& request_id, UploadOutcome outcome) {
  std::optional<Pending> pending;
  {
    std::lock_guard lock(table_->mutex);
    pending = table_->TakeByRequestLocked(request_id);
  }

  if (!pending) {
    VOICECODE_LOG_DEBUG("acknowledgment for unknown or completed request", {StringField("request_id", request_id)});
    return false;
  }

  Complete(std::move(*pending), std::move(outcome));
  return true;
}

bool AckCoordinator::ResolveByFallbackMatch(UploadOutcome outcome) {
  std::optional<Pending> pending;
  std::size_t            pending_count = 0;
  {
    std::lock_guard lock(table_->mutex);
    pending_count = table_->by_key.size();
    if (pending_count == 1) {
      const auto key = table_->by_key.begin()->first;
      pending        = table_->TakeLocked(key);
    }
  }

  if (!pending) {
    VOICECODE_LOG_WARN("AmbiguousFallback: acknowledgment matches no single pending upload",
                       {StringField("resolved_name", outcome.resolved_name), IntField("pending", static_cast<int64_t>(pending_count))});
    return false;
  }

  VOICECODE_LOG_WARN("acknowledgment name differs from request, matched by fallback",
                     {StringField("key", pending->key), StringField("resolved_name", outcome.resolved_name)});
  Complete(std::move(*pending), std::move(outcome));
  return true;
}

bool AckCoordinator::HandleResponse(const voicecode::session::v1::UploadFileResult& result) {
  UploadOutcome outcome;
  if (result.success()) {
    outcome.status        = UploadStatus::kSucceeded;
    outcome.resolved_name = result.filename();
  } else {
    outcome.status        = UploadStatus::kRejected;
    outcome.resolved_name = result.filename();
    outcome.message       = result.error().empty() ? "Upload failed" : result.error();
  }

  // An echoed request id identifies the request exactly; if it is no longer
  // pending the acknowledgment is late and must not fall through to a newer
  // request for the same file.
  if (!result.request_id().empty()) {
    return ResolveByRequestId(result.request_id(), std::move(outcome));
  }

  if (!result.filename().empty()) {
    bool known = false;
    {
      std::lock_guard lock(table_->mutex);
      known = table_->by_key.count(result.filename()) != 0;
    }
    if (known) return Resolve(result.filename(), std::move(outcome));
  }

  return ResolveByFallbackMatch(std::move(outcome));
}

// ------------------------------------------------------------
// Cancellation
// ------------------------------------------------------------

bool AckCoordinator::Abandon(const std::string& key) {
  std::lock_guard lock(table_->mutex);
  auto it = table_->by_key.find(key);
  if (it == table_->by_key.end()) return false;

  it->second.abandoned = true;
  VOICECODE_LOG_INFO("upload abandoned by caller", {StringField("key", key), StringField("request_id", it->second.request_id)});
  return true;
}

std::size_t AckCoordinator::FailAll(const std::string& reason) {
  std::vector<Pending> taken;
  {
    std::lock_guard lock(table_->mutex);
    taken.reserve(table_->by_key.size());
    for (auto& [_, pending] : table_->by_key) taken.push_back(std::move(pending));
    table_->by_key.clear();
    table_->key_by_request.clear();
  }
  std::sort(taken.begin(), taken.end(), [](const Pending& a, const Pending& b) { return a.created_seq < b.created_seq; });

  if (!taken.empty()) {
    VOICECODE_LOG_WARN("failing pending uploads", {StringField("reason", reason), IntField("count", static_cast<int64_t>(taken.size()))});
  }

  for (auto& pending : taken) {
    UploadOutcome outcome;
    outcome.status  = UploadStatus::kTransportFailure;
    outcome.message = reason;
    Complete(std::move(pending), std::move(outcome));
  }
  return taken.size();
}

std::size_t AckCoordinator::PendingCount() const {
  std::lock_guard lock(table_->mutex);
  return table_->by_key.size();
}

bool AckCoordinator::IsPending(const std::string& key) const {
  std::lock_guard lock(table_->mutex);
  return table_->by_key.count(key) != 0;
}

} // namespace voicecode::upload
