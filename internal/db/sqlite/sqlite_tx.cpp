#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace receiver::db::sqlite {

namespace {

// BEGIN/COMMIT failures surface as CommitError so callers see one error type.
[[noreturn]] void ThrowCommitError(const SqliteError& e, const char* statement) {
  const std::string message = std::string(statement) + ": " + e.what();
  switch (e.code()) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      throw CommitError(Result::Err(ErrorCode::Busy, message));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      throw CommitError(Result::Err(ErrorCode::IOError, message));
    default:
      throw CommitError(Result::Err(ErrorCode::InternalError, message));
  }
}

} // namespace

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TransactionMutex()) {
  try {
    db_->Exec("BEGIN IMMEDIATE;");
  } catch (const SqliteError& e) {
    ThrowCommitError(e, "begin");
  }
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      RECEIVER_LOG_WARN("sqlite rollback failed", {receiver::observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  // on failure the transaction stays open; the destructor rolls it back
  try {
    db_->Exec("COMMIT;");
  } catch (const SqliteError& e) {
    ThrowCommitError(e, "commit");
  }
  committed_ = true;
  finished_  = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_->Exec("ROLLBACK;");
  lock_.unlock();
}

} // namespace receiver::db::sqlite
