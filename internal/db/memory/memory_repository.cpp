#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace voicecode::db::memory {

namespace {

MemoryTransaction& TX(Transaction& t) {
  return static_cast<MemoryTransaction&>(t);
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

std::vector<model::QueueEntryRecord> MemoryRepository::ListQueueEntries(Transaction& t) {
  const auto& entries = TX(t).View().queue_entries;

  std::vector<model::QueueEntryRecord> out;
  out.reserve(entries.size());
  for (const auto& [_, record] : entries) out.push_back(record);
  return out;
}

std::optional<model::QueueEntryRecord> MemoryRepository::GetQueueEntry(Transaction& t, const std::string& session_id) {
  const auto& entries = TX(t).View().queue_entries;

  auto it = entries.find(session_id);
  if (it == entries.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertQueueEntry(Transaction& t, const model::QueueEntryRecord& record) {
  if (record.session_id.empty()) {
    return Result::Err(ErrorCode::ConstraintViolation, "queue entry session_id must not be empty");
  }
  TX(t).Mutable().queue_entries[record.session_id] = record;
  return Result::Ok();
}

Result MemoryRepository::DeleteQueueEntry(Transaction& t, const std::string& session_id) {
  if (TX(t).Mutable().queue_entries.erase(session_id) == 0) {
    return Result::Err(ErrorCode::NotFound, "queue entry not found: " + session_id);
  }
  return Result::Ok();
}

} // namespace voicecode::db::memory
