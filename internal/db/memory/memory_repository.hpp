#pragma once

#include <cstdint>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace voicecode::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  std::vector<model::QueueEntryRecord> ListQueueEntries(Transaction&) override;
  std::optional<model::QueueEntryRecord> GetQueueEntry(Transaction&, const std::string&) override;
  Result UpsertQueueEntry(Transaction&, const model::QueueEntryRecord&) override;
  Result DeleteQueueEntry(Transaction&, const std::string&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::QueueEntryRecord> queue_entries;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}
