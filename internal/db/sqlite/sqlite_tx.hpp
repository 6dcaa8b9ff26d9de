#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace receiver::db::sqlite {

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE, so the file's write lock is taken up front.
  Construction and Commit() throw CommitError{Busy} when another
  connection still holds that lock after the busy timeout.

  The connection is shared, so a transaction also holds the
  connection's transaction mutex until it finishes.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
  bool committed_ = false;
  bool finished_  = false;
};

}
