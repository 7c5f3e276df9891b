#include "factory.hpp"

#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/observability/logging.hpp"

namespace voicecode::factory {

using voicecode::observability::BoolField;
using voicecode::observability::IntField;
using voicecode::observability::StringField;

queue::OrderKeyPolicy PolicyFromConfig(const voicecode::runtime::config::QueueConfig& config) {
  queue::OrderKeyPolicy policy;
  if (config.origin() != 0.0) policy.origin = config.origin();
  if (config.unit_step() > 0.0) policy.unit_step = config.unit_step();
  if (config.min_gap() > 0.0) policy.min_gap = config.min_gap();
  if (config.renormalize_step() > 0.0) policy.renormalize_step = config.renormalize_step();
  return policy;
}

std::shared_ptr<db::Repository> BuildRepository(const voicecode::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    const auto& sqlite = database.sqlite();
    VOICECODE_LOG_INFO("opening sqlite store", {StringField("path", sqlite.path()), BoolField("wal_mode", sqlite.wal_mode())});

    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), sqlite.wal_mode());
    db::sqlite::SqliteRepository::BootstrapSchema(*sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  VOICECODE_LOG_INFO("using in-memory store; queue will not survive restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const voicecode::runtime::config::RuntimeConfig& config, std::shared_ptr<upload::Transport> transport,
                  std::shared_ptr<window::WindowPresenter> presenter) {
  Application app;

  // ------------------------------------------------------------------
  // Store + priority queue
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.queue      = std::make_shared<queue::PriorityQueueManager>(app.repository, PolicyFromConfig(config.queue()));
  app.queue->Hydrate();

  // ------------------------------------------------------------------
  // Window claims
  // ------------------------------------------------------------------
  app.windows = std::make_shared<window::WindowSessionRegistry>(std::move(presenter));

  // ------------------------------------------------------------------
  // Uploads
  // ------------------------------------------------------------------
  if (transport) {
    app.timers  = std::make_shared<upload::ThreadTimerService>();
    app.acks    = std::make_shared<upload::AckCoordinator>(transport, app.timers);
    app.uploads = std::make_shared<upload::UploadService>(transport, app.acks, config.uploads());
  }

  VOICECODE_LOG_INFO("session core built", {IntField("queued_sessions", static_cast<int64_t>(app.queue->Size())),
                                            BoolField("uploads_enabled", static_cast<bool>(app.uploads))});
  return app;
}

} // namespace voicecode::factory
