#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace glucolumin::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, bool read_only)
    : db_(std::move(db)), lock_(db_->Mutex()), read_only_(read_only) {
  db_->Exec(read_only_ ? "BEGIN DEFERRED;" : "BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      GLUCOLUMIN_LOG_ERROR("sqlite rollback failed", {observability::StringField("path", db_->Path()), observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  finished_ = true;
  lock_.unlock();
}

} // namespace glucolumin::db::sqlite
