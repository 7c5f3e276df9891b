#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/queue_entry_record.hpp"

namespace voicecode::db {

/*
  Repository abstraction.

  The store is write-through and authoritative for the priority queue:
  PriorityQueueManager writes here before releasing its lock, so the
  in-memory order and the persisted order never diverge.

  - All writes require a Transaction
  - Reads inside a transaction see its writes

  Window claims are process-lifetime only and never reach the store.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Priority queue
  // ---------------------------------------------------------------------

  // Unordered; callers sort.
  virtual std::vector<model::QueueEntryRecord> ListQueueEntries(Transaction&) = 0;

  virtual std::optional<model::QueueEntryRecord> GetQueueEntry(Transaction&, const std::string& session_id) = 0;

  virtual Result UpsertQueueEntry(Transaction&, const model::QueueEntryRecord&) = 0;

  // NotFound if the session is not queued.
  virtual Result DeleteQueueEntry(Transaction&, const std::string& session_id) = 0;
};

} // namespace voicecode::db
