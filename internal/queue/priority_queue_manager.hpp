#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "order_key_sequencer.hpp"
#include "queue_entry.hpp"

namespace voicecode::queue {

struct QueueChange {
  enum class Kind { kEnqueued, kRemoved, kPriorityChanged, kReordered, kRenormalized, kHydrated };

  Kind        kind;
  std::string session_id; // empty for kRenormalized / kHydrated
};

const char* ToString(QueueChange::Kind kind);

using QueueChangeListener = std::function<void(const QueueChange&)>;

/*
  Reorderable priority queue of sessions.

  Consistency model:
  - One mutex serializes every mutation, renormalization included, so a
    renormalization never interleaves with a move.
  - Every mutation is written through a store transaction while the mutex
    is held. In-memory state is replaced only after the commit succeeded;
    a failed write leaves memory exactly as persisted.
  - Listeners run after the mutex is released and may call back in.
*/
class PriorityQueueManager {
 public:
  explicit PriorityQueueManager(std::shared_ptr<voicecode::db::Repository> repository, OrderKeyPolicy policy = {});

  // Replaces in-memory state with the store's contents.
  void Hydrate();

  // Appends at the tail of the priority bucket. False if already queued.
  bool Enqueue(const std::string& session_id,
               voicecode::session::v1::Priority priority = voicecode::session::v1::PRIORITY_LOW);

  // False if the session was not queued.
  bool Remove(const std::string& session_id);

  // Moves to the tail of the new bucket. False if the priority is unchanged.
  bool ChangePriority(const std::string& session_id, voicecode::session::v1::Priority priority);

  // Places `moving` between `above` and `below`. The entry adopts below's
  // bucket (above's if there is no below). False if it already sits there.
  bool Reorder(const std::string& moving, const std::optional<std::string>& above, const std::optional<std::string>& below);

  // List form of Reorder: insert before `destination` in the current sorted
  // order. destination == source or source + 1 is a no-op.
  bool Move(std::size_t source, std::size_t destination);

  // Rewrites every key with even spacing.
  void Renormalize();

  std::vector<QueueEntry>   Snapshot() const;
  std::optional<QueueEntry> Get(const std::string& session_id) const;
  bool                      Contains(const std::string& session_id) const;
  std::size_t               Size() const;

  const OrderKeyPolicy& Policy() const {
    return policy_;
  }

  void AddListener(QueueChangeListener listener);

 private:
  using EntryMap = std::unordered_map<std::string, QueueEntry>;

  std::vector<QueueEntry> SortedLocked() const;

  std::optional<QueueChange> ReorderLocked(const std::string& moving, std::optional<std::string> above, std::optional<std::string> below);

  // Persists entries and swaps them into entries_; rolls back on failure.
  void WriteThroughLocked(const std::vector<QueueEntry>& upserts, const std::vector<std::string>& deletes, const char* context);

  // Renormalizes if needed. Store failures are logged, never thrown.
  bool MaybeRenormalizeLocked();

  void Notify(const std::vector<QueueChange>& changes);

  std::shared_ptr<voicecode::db::Repository> repository_;
  OrderKeyPolicy                             policy_;

  mutable std::mutex mutex_;
  EntryMap           entries_;

  std::mutex                       listeners_mutex_;
  std::vector<QueueChangeListener> listeners_;
};

} // namespace voicecode::queue
