#include "sqlite_db.hpp"

#include "internal/observability/logging.hpp"

namespace receiver::db::sqlite {

using receiver::observability::IntField;
using receiver::observability::StringField;

SqliteDB::SqliteDB(std::string path, std::chrono::milliseconds busy_timeout) : path_(std::move(path)) {
  const int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    const std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw SqliteError(rc, "open receiver store '" + path_ + "': " + msg);
  }

  try {
    Configure(busy_timeout);
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    throw SqliteError(rc & 0xff, msg);
  }
}

void SqliteDB::Configure(std::chrono::milliseconds busy_timeout) {
  // readers (trigger lookups) keep going while a create/delete holds the write lock
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");

  const int rc = sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout.count()));
  if (rc != SQLITE_OK) {
    throw SqliteError(rc, std::string("busy_timeout: ") + sqlite3_errmsg(db_));
  }

  RECEIVER_LOG_DEBUG("receiver store opened",
                     {StringField("path", path_), IntField("busy_timeout_ms", static_cast<int64_t>(busy_timeout.count()))});
}

} // namespace receiver::db::sqlite
