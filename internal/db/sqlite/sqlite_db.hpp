#pragma once

#include <sqlite3.h>

#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace receiver::db::sqlite {

// A failed sqlite3 call; code() is the primary result code (SQLITE_BUSY, ...).
class SqliteError : public std::runtime_error {
 public:
  SqliteError(int code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  int code() const {
    return code_;
  }

 private:
  int code_;
};

/*
  One connection to the receiver store file.

  Writers serialize on the file lock; a writer that cannot get it within
  busy_timeout fails with SQLITE_BUSY.
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  static constexpr std::chrono::milliseconds kDefaultBusyTimeout{5000};

  explicit SqliteDB(std::string path, std::chrono::milliseconds busy_timeout = kDefaultBusyTimeout);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // throws SqliteError
  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  // Held by the open transaction on this connection.
  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

 private:
  void Configure(std::chrono::milliseconds busy_timeout);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace receiver::db::sqlite
