#include "internal/db/memory/memory_repository.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

namespace {

using voicecode::db::ErrorCode;
using voicecode::db::memory::MemoryRepository;
using voicecode::db::model::QueueEntryRecord;

QueueEntryRecord Record(const std::string& id, double key) {
  QueueEntryRecord record;
  record.session_id   = id;
  record.priority     = voicecode::session::v1::PRIORITY_MEDIUM;
  record.order_key    = key;
  record.queued_at_ms = 1700000000000;
  return record;
}

void TestWritesInvisibleUntilCommit() {
  MemoryRepository repo;

  auto writer = repo.Begin();
  assert(repo.UpsertQueueEntry(*writer, Record("s1", 1.0)));
  assert(repo.GetQueueEntry(*writer, "s1").has_value());

  {
    auto reader = repo.Begin();
    assert(!repo.GetQueueEntry(*reader, "s1").has_value());
  }

  writer->Commit();
  assert(writer->IsCommitted());

  auto reader = repo.Begin();
  auto stored = repo.GetQueueEntry(*reader, "s1");
  assert(stored.has_value());
  assert(stored->order_key == 1.0);
  assert(stored->priority == voicecode::session::v1::PRIORITY_MEDIUM);
}

void TestDestructorRollsBack() {
  MemoryRepository repo;
  {
    auto tx = repo.Begin();
    assert(repo.UpsertQueueEntry(*tx, Record("s1", 1.0)));
  }

  auto tx = repo.Begin();
  assert(repo.ListQueueEntries(*tx).empty());
}

void TestDeleteMissingIsNotFound() {
  MemoryRepository repo;
  auto             tx     = repo.Begin();
  auto             result = repo.DeleteQueueEntry(*tx, "missing");
  assert(!result);
  assert(result.code == ErrorCode::NotFound);
}

void TestEmptySessionIdIsRejected() {
  MemoryRepository repo;
  auto             tx     = repo.Begin();
  auto             result = repo.UpsertQueueEntry(*tx, Record("", 1.0));
  assert(result.code == ErrorCode::ConstraintViolation);
}

void TestConcurrentCommitConflicts() {
  MemoryRepository repo;

  auto first  = repo.Begin();
  auto second = repo.Begin();
  assert(repo.UpsertQueueEntry(*first, Record("a", 1.0)));
  assert(repo.UpsertQueueEntry(*second, Record("b", 2.0)));

  first->Commit();

  bool threw = false;
  try {
    second->Commit();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  auto tx = repo.Begin();
  assert(repo.ListQueueEntries(*tx).size() == 1);
}

} // namespace

int main() {
  TestWritesInvisibleUntilCommit();
  TestDestructorRollsBack();
  TestDeleteMissingIsNotFound();
  TestEmptySessionIdIsRejected();
  TestConcurrentCommitConflicts();

  std::cout << "voicecode_unit_memory_repository: pass\n";
  return 0;
}
