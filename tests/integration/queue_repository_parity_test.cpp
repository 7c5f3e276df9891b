#include <cassert>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/queue/priority_queue_manager.hpp"

namespace {

using voicecode::db::ErrorCode;
using voicecode::db::Repository;
using voicecode::db::memory::MemoryRepository;
using voicecode::db::model::QueueEntryRecord;
using voicecode::db::sqlite::SqliteDB;
using voicecode::db::sqlite::SqliteRepository;
using voicecode::queue::PriorityQueueManager;
using voicecode::queue::QueueEntry;
using voicecode::session::v1::PRIORITY_HIGH;
using voicecode::session::v1::PRIORITY_LOW;
using voicecode::session::v1::PRIORITY_MEDIUM;

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

std::filesystem::path SqlitePath() {
  const auto dir = std::filesystem::temp_directory_path() / "voicecode_queue_parity";
  std::filesystem::create_directories(dir);
  return dir / "queue.db";
}

std::shared_ptr<Repository> OpenSqlite() {
  auto db = std::make_shared<SqliteDB>(SqlitePath().string());
  SqliteRepository::BootstrapSchema(*db);
  return std::make_shared<SqliteRepository>(std::move(db));
}

void RemoveSqliteFiles() {
  const auto path = SqlitePath();
  std::filesystem::remove(path);
  std::filesystem::remove(path.string() + "-wal");
  std::filesystem::remove(path.string() + "-shm");
}

std::vector<BackendFactory> Backends() {
  std::vector<BackendFactory> backends;

  backends.push_back({"memory", [] { return std::make_shared<MemoryRepository>(); }, [] { return false; },
                      [](std::shared_ptr<Repository>&) {}, [] {}});

  backends.push_back({"sqlite",
                      [] {
                        RemoveSqliteFiles();
                        return OpenSqlite();
                      },
                      [] { return true; },
                      [](std::shared_ptr<Repository>& repo) {
                        repo.reset();
                        repo = OpenSqlite();
                      },
                      [] { RemoveSqliteFiles(); }});

  return backends;
}

std::vector<std::string> Ids(const std::vector<QueueEntry>& entries) {
  std::vector<std::string> ids;
  for (const auto& entry : entries) ids.push_back(entry.session_id);
  return ids;
}

void VerifyRepositoryContract(Repository& repo) {
  auto tx = repo.Begin();

  QueueEntryRecord record;
  record.session_id   = "contract";
  record.priority     = PRIORITY_MEDIUM;
  record.order_key    = 0.125;
  record.queued_at_ms = 1700000000123;
  assert(repo.UpsertQueueEntry(*tx, record));

  auto stored = repo.GetQueueEntry(*tx, "contract");
  assert(stored.has_value());
  assert(stored->priority == PRIORITY_MEDIUM);
  assert(stored->order_key == 0.125);
  assert(stored->queued_at_ms == 1700000000123);

  record.order_key = 0.25;
  assert(repo.UpsertQueueEntry(*tx, record));
  assert(repo.GetQueueEntry(*tx, "contract")->order_key == 0.25);

  assert(repo.DeleteQueueEntry(*tx, "contract"));
  auto missing = repo.DeleteQueueEntry(*tx, "contract");
  assert(missing.code == ErrorCode::NotFound);

  tx->Rollback();
}

std::vector<QueueEntry> RunScenario(const std::shared_ptr<Repository>& repo) {
  PriorityQueueManager queue(repo);
  queue.Hydrate();

  queue.Enqueue("s1");
  queue.Enqueue("s2");
  queue.Enqueue("s3");
  queue.Enqueue("s4", PRIORITY_HIGH);
  queue.Enqueue("s5", PRIORITY_MEDIUM);

  queue.Move(4, 2);                                      // s3 above s1
  queue.Reorder("s2", std::string("s4"), std::nullopt);  // into the high bucket
  queue.ChangePriority("s5", PRIORITY_LOW);
  queue.Remove("s1");

  queue.Enqueue("s6");

  // halve the gap under s3 until the keys run out and get renormalized
  for (int i = 0; i < 45; ++i) queue.Move(4, 3);

  return queue.Snapshot();
}

void RunBackend(const BackendFactory& backend) {
  auto repo = backend.make_repository();

  VerifyRepositoryContract(*repo);
  const auto snapshot = RunScenario(repo);

  // s3 started at 0.0; only a renormalization moves it to the origin
  assert(snapshot[2].session_id == "s3");
  assert(snapshot[2].order_key == 1.0);

  // store agrees with memory
  {
    PriorityQueueManager reloaded(repo);
    reloaded.Hydrate();
    const auto hydrated = reloaded.Snapshot();
    assert(Ids(hydrated) == Ids(snapshot));
    for (std::size_t i = 0; i < hydrated.size(); ++i) {
      assert(hydrated[i].priority == snapshot[i].priority);
      assert(hydrated[i].order_key == snapshot[i].order_key);
    }
  }

  if (backend.supports_restart()) {
    backend.restart(repo);
    PriorityQueueManager reopened(repo);
    reopened.Hydrate();
    assert(Ids(reopened.Snapshot()) == Ids(snapshot));
  }

  backend.cleanup();
  std::cout << "  backend " << backend.name << ": " << snapshot.size() << " entries\n";
}

} // namespace

int main() {
  std::vector<std::vector<std::string>> orders;

  for (const auto& backend : Backends()) {
    RunBackend(backend);

    auto repo = backend.make_repository();
    orders.push_back(Ids(RunScenario(repo)));
    backend.cleanup();
  }

  for (const auto& order : orders) assert(order == orders.front());
  assert((orders.front() == std::vector<std::string>{"s4", "s2", "s3", "s6", "s5"}));

  std::cout << "voicecode_integration_queue_repository_parity: pass\n";
  return 0;
}
