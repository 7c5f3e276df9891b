#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace voicecode::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  // Creates the queue table if missing. Idempotent.
  static void BootstrapSchema(SqliteDB& db);

  std::unique_ptr<Transaction> Begin() override;

  std::vector<model::QueueEntryRecord>   ListQueueEntries(Transaction&) override;
  std::optional<model::QueueEntryRecord> GetQueueEntry(Transaction&, const std::string& session_id) override;
  Result                                 UpsertQueueEntry(Transaction&, const model::QueueEntryRecord&) override;
  Result                                 DeleteQueueEntry(Transaction&, const std::string& session_id) override;

 private:
  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace voicecode::db::sqlite
