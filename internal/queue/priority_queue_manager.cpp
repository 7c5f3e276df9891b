#include "priority_queue_manager.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace voicecode::queue {

using voicecode::observability::DoubleField;
using voicecode::observability::IntField;
using voicecode::observability::StringField;
using voicecode::session::v1::Priority;

namespace {

void ThrowIfDbError(const voicecode::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case voicecode::db::ErrorCode::NotFound:
      throw voicecode::util::NotFound(message);
    case voicecode::db::ErrorCode::AlreadyExists:
      throw voicecode::util::AlreadyExists(message);
    default:
      throw voicecode::util::StoreError(message + " (" + voicecode::db::ToString(result.code) + ")");
  }
}

db::model::QueueEntryRecord ToRecord(const QueueEntry& entry) {
  db::model::QueueEntryRecord record;
  record.session_id   = entry.session_id;
  record.priority     = entry.priority;
  record.order_key    = entry.order_key;
  record.queued_at_ms = entry.queued_at_ms;
  return record;
}

QueueEntry FromRecord(const db::model::QueueEntryRecord& record) {
  QueueEntry entry;
  entry.session_id   = record.session_id;
  entry.priority     = record.priority;
  entry.order_key    = record.order_key;
  entry.queued_at_ms = record.queued_at_ms;
  return entry;
}

std::optional<double> TailKey(const std::vector<QueueEntry>& sorted, Priority priority, const std::string& exclude) {
  std::optional<double> tail;
  for (const auto& entry : sorted) {
    if (entry.priority != priority || entry.session_id == exclude) continue;
    tail = entry.order_key;
  }
  return tail;
}

} // namespace

const char* ToString(QueueChange::Kind kind) {
  switch (kind) {
    case QueueChange::Kind::kEnqueued:        return "enqueued";
    case QueueChange::Kind::kRemoved:         return "removed";
    case QueueChange::Kind::kPriorityChanged: return "priority_changed";
    case QueueChange::Kind::kReordered:       return "reordered";
    case QueueChange::Kind::kRenormalized:    return "renormalized";
    case QueueChange::Kind::kHydrated:        return "hydrated";
  }
  return "unknown";
}

PriorityQueueManager::PriorityQueueManager(std::shared_ptr<voicecode::db::Repository> repository, OrderKeyPolicy policy)
    : repository_(std::move(repository)), policy_(policy) {
  if (!repository_) {
    throw std::invalid_argument("PriorityQueueManager requires a repository");
  }
}

// ------------------------------------------------------------
// Write-through
// ------------------------------------------------------------

void PriorityQueueManager::WriteThroughLocked(const std::vector<QueueEntry>& upserts, const std::vector<std::string>& deletes,
                                              const char* context) {
  {
    auto tx = repository_->Begin();
    for (const auto& entry : upserts) {
      ThrowIfDbError(repository_->UpsertQueueEntry(*tx, ToRecord(entry)), context);
    }
    for (const auto& session_id : deletes) {
      ThrowIfDbError(repository_->DeleteQueueEntry(*tx, session_id), context);
    }

    try {
      tx->Commit();
    } catch (const std::exception& e) {
      throw voicecode::util::StoreError(std::string(context) + ": commit failed: " + e.what());
    }
  }

  // committed; now memory may follow
  for (const auto& entry : upserts) entries_[entry.session_id] = entry;
  for (const auto& session_id : deletes) entries_.erase(session_id);
}

std::vector<QueueEntry> PriorityQueueManager::SortedLocked() const {
  std::vector<QueueEntry> sorted;
  sorted.reserve(entries_.size());
  for (const auto& [_, entry] : entries_) sorted.push_back(entry);
  SortEntries(sorted);
  return sorted;
}

bool PriorityQueueManager::MaybeRenormalizeLocked() {
  const auto sorted = SortedLocked();
  if (!NeedsRenormalization(sorted, policy_)) return false;

  VOICECODE_LOG_INFO("priority queue keys exhausted, renormalizing", {IntField("entries", static_cast<int64_t>(sorted.size()))});
  try {
    WriteThroughLocked(voicecode::queue::Renormalize(sorted, policy_), {}, "renormalize queue");
  } catch (const std::exception& e) {
    // memory still matches the store; the next write re-checks
    VOICECODE_LOG_ERROR("priority queue renormalization failed", {StringField("error", e.what())});
    return false;
  }
  return true;
}

// ------------------------------------------------------------
// Hydrate
// ------------------------------------------------------------

void PriorityQueueManager::Hydrate() {
  std::vector<QueueChange> changes;
  {
    std::lock_guard lock(mutex_);

    std::vector<db::model::QueueEntryRecord> records;
    {
      auto tx = repository_->Begin();
      records = repository_->ListQueueEntries(*tx);
      tx->Rollback();
    }

    entries_.clear();
    for (const auto& record : records) entries_[record.session_id] = FromRecord(record);

    VOICECODE_LOG_INFO("priority queue hydrated", {IntField("entries", static_cast<int64_t>(entries_.size()))});

    changes.push_back({QueueChange::Kind::kHydrated, {}});
    if (MaybeRenormalizeLocked()) changes.push_back({QueueChange::Kind::kRenormalized, {}});
  }
  Notify(changes);
}

// ------------------------------------------------------------
// Membership
// ------------------------------------------------------------

bool PriorityQueueManager::Enqueue(const std::string& session_id, Priority priority) {
  if (session_id.empty()) {
    throw std::invalid_argument("enqueue: session id must not be empty");
  }
  if (priority == voicecode::session::v1::PRIORITY_UNSPECIFIED) priority = voicecode::session::v1::PRIORITY_LOW;

  {
    std::lock_guard lock(mutex_);

    if (entries_.count(session_id)) {
      VOICECODE_LOG_INFO("session already in priority queue", {StringField("session_id", session_id)});
      return false;
    }

    QueueEntry entry;
    entry.session_id   = session_id;
    entry.priority     = priority;
    entry.order_key    = ComputeInsertionKey(TailKey(SortedLocked(), priority, session_id), std::nullopt, policy_);
    entry.queued_at_ms = voicecode::util::NowUnixMillis();

    WriteThroughLocked({entry}, {}, "enqueue session");

    VOICECODE_LOG_INFO("session added to priority queue",
                       {StringField("session_id", session_id), IntField("priority", priority), DoubleField("order", entry.order_key)});
  }

  Notify({{QueueChange::Kind::kEnqueued, session_id}});
  return true;
}

bool PriorityQueueManager::Remove(const std::string& session_id) {
  {
    std::lock_guard lock(mutex_);

    if (!entries_.count(session_id)) {
      VOICECODE_LOG_INFO("session not in priority queue", {StringField("session_id", session_id)});
      return false;
    }

    WriteThroughLocked({}, {session_id}, "remove session");
    VOICECODE_LOG_INFO("session removed from priority queue", {StringField("session_id", session_id)});
  }

  Notify({{QueueChange::Kind::kRemoved, session_id}});
  return true;
}

bool PriorityQueueManager::ChangePriority(const std::string& session_id, Priority priority) {
  if (priority == voicecode::session::v1::PRIORITY_UNSPECIFIED) {
    throw std::invalid_argument("change priority: priority must be specified");
  }

  {
    std::lock_guard lock(mutex_);

    auto it = entries_.find(session_id);
    if (it == entries_.end()) {
      throw voicecode::util::NotFound("change priority: session not in priority queue: " + session_id);
    }

    const auto old_priority = it->second.priority;
    if (old_priority == priority) {
      VOICECODE_LOG_DEBUG("priority unchanged", {StringField("session_id", session_id), IntField("priority", priority)});
      return false;
    }

    auto updated      = it->second;
    updated.priority  = priority;
    updated.order_key = ComputeInsertionKey(TailKey(SortedLocked(), priority, session_id), std::nullopt, policy_);

    WriteThroughLocked({updated}, {}, "change priority");

    VOICECODE_LOG_INFO("session priority changed", {StringField("session_id", session_id), IntField("from", old_priority),
                                                     IntField("to", priority), DoubleField("order", updated.order_key)});
  }

  Notify({{QueueChange::Kind::kPriorityChanged, session_id}});
  return true;
}

// ------------------------------------------------------------
// Reorder
// ------------------------------------------------------------

std::optional<QueueChange> PriorityQueueManager::ReorderLocked(const std::string& moving, std::optional<std::string> above,
                                                               std::optional<std::string> below) {
  auto moving_it = entries_.find(moving);
  if (moving_it == entries_.end()) {
    throw voicecode::util::NotFound("reorder: session not in priority queue: " + moving);
  }

  // the moving entry is never its own neighbour
  if (above && *above == moving) above.reset();
  if (below && *below == moving) below.reset();

  auto lookup = [&](const std::optional<std::string>& id, const char* role) -> std::optional<QueueEntry> {
    if (!id) return std::nullopt;
    auto it = entries_.find(*id);
    if (it == entries_.end()) {
      VOICECODE_LOG_WARN("reorder neighbour no longer queued", {StringField("role", role), StringField("session_id", *id)});
      return std::nullopt;
    }
    return it->second;
  };

  auto above_entry = lookup(above, "above");
  auto below_entry = lookup(below, "below");

  const auto sorted = SortedLocked();
  const auto pos    = std::find_if(sorted.begin(), sorted.end(), [&](const QueueEntry& e) { return e.session_id == moving; });
  const auto index  = static_cast<std::size_t>(pos - sorted.begin());

  const std::optional<std::string> current_above = index > 0 ? std::optional<std::string>(sorted[index - 1].session_id) : std::nullopt;
  const std::optional<std::string> current_below =
      index + 1 < sorted.size() ? std::optional<std::string>(sorted[index + 1].session_id) : std::nullopt;

  auto id_of = [](const std::optional<QueueEntry>& e) { return e ? std::optional<std::string>(e->session_id) : std::nullopt; };
  if (id_of(above_entry) == current_above && id_of(below_entry) == current_below) {
    VOICECODE_LOG_DEBUG("reorder target equals current position", {StringField("session_id", moving)});
    return std::nullopt;
  }

  const auto target = below_entry ? below_entry->priority : above_entry ? above_entry->priority : moving_it->second.priority;
  if (above_entry && above_entry->priority != target) above_entry.reset();

  std::optional<double> above_key = above_entry ? std::optional<double>(above_entry->order_key) : std::nullopt;
  std::optional<double> below_key = below_entry ? std::optional<double>(below_entry->order_key) : std::nullopt;

  auto updated      = moving_it->second;
  updated.priority  = target;
  updated.order_key = ComputeInsertionKey(above_key, below_key, policy_);

  WriteThroughLocked({updated}, {}, "reorder session");

  VOICECODE_LOG_INFO("session reordered", {StringField("session_id", moving), StringField("above", above_entry ? above_entry->session_id : "nil"),
                                           StringField("below", below_entry ? below_entry->session_id : "nil"), IntField("priority", target),
                                           DoubleField("order", updated.order_key)});

  return QueueChange{QueueChange::Kind::kReordered, moving};
}

bool PriorityQueueManager::Reorder(const std::string& moving, const std::optional<std::string>& above, const std::optional<std::string>& below) {
  std::vector<QueueChange> changes;
  {
    std::lock_guard lock(mutex_);

    auto change = ReorderLocked(moving, above, below);
    if (!change) return false;
    changes.push_back(*change);

    if (MaybeRenormalizeLocked()) changes.push_back({QueueChange::Kind::kRenormalized, {}});
  }

  Notify(changes);
  return true;
}

bool PriorityQueueManager::Move(std::size_t source, std::size_t destination) {
  std::vector<QueueChange> changes;
  {
    std::lock_guard lock(mutex_);

    const auto sorted = SortedLocked();
    if (source >= sorted.size() || destination > sorted.size()) {
      throw std::out_of_range("move: index out of range (source=" + std::to_string(source) + " destination=" +
                              std::to_string(destination) + " size=" + std::to_string(sorted.size()) + ")");
    }

    // "insert before destination": both of these leave the entry where it is
    if (destination == source || destination == source + 1) {
      return false;
    }

    const auto& moving = sorted[source].session_id;
    std::optional<std::string> above = destination > 0 ? std::optional<std::string>(sorted[destination - 1].session_id) : std::nullopt;
    std::optional<std::string> below = destination < sorted.size() ? std::optional<std::string>(sorted[destination].session_id) : std::nullopt;

    VOICECODE_LOG_DEBUG("moving queue entry", {IntField("source", static_cast<int64_t>(source)), IntField("destination", static_cast<int64_t>(destination))});

    auto change = ReorderLocked(moving, above, below);
    if (!change) return false;
    changes.push_back(*change);

    if (MaybeRenormalizeLocked()) changes.push_back({QueueChange::Kind::kRenormalized, {}});
  }

  Notify(changes);
  return true;
}

void PriorityQueueManager::Renormalize() {
  {
    std::lock_guard lock(mutex_);
    WriteThroughLocked(voicecode::queue::Renormalize(SortedLocked(), policy_), {}, "renormalize queue");
    VOICECODE_LOG_INFO("priority queue renormalized", {IntField("entries", static_cast<int64_t>(entries_.size()))});
  }
  Notify({{QueueChange::Kind::kRenormalized, {}}});
}

// ------------------------------------------------------------
// Queries
// ------------------------------------------------------------

std::vector<QueueEntry> PriorityQueueManager::Snapshot() const {
  std::lock_guard lock(mutex_);
  return SortedLocked();
}

std::optional<QueueEntry> PriorityQueueManager::Get(const std::string& session_id) const {
  std::lock_guard lock(mutex_);
  auto it = entries_.find(session_id);
  if (it == entries_.end()) return std::nullopt;
  return it->second;
}

bool PriorityQueueManager::Contains(const std::string& session_id) const {
  std::lock_guard lock(mutex_);
  return entries_.count(session_id) != 0;
}

std::size_t PriorityQueueManager::Size() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

// ------------------------------------------------------------
// Notifications
// ------------------------------------------------------------

void PriorityQueueManager::AddListener(QueueChangeListener listener) {
  std::lock_guard lock(listeners_mutex_);
  listeners_.push_back(std::move(listener));
}

void PriorityQueueManager::Notify(const std::vector<QueueChange>& changes) {
  std::vector<QueueChangeListener> listeners;
  {
    std::lock_guard lock(listeners_mutex_);
    listeners = listeners_;
  }

  for (const auto& change : changes) {
    for (const auto& listener : listeners) {
      try {
        listener(change);
      } catch (const std::exception& e) {
        VOICECODE_LOG_ERROR("queue change listener failed", {StringField("change", ToString(change.kind)), StringField("error", e.what())});
      }
    }
  }
}

} // namespace voicecode::queue
