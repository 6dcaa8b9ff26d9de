#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace receiver::db::sqlite {

using receiver::db::ErrorCode;
using receiver::db::Result;

namespace {

constexpr const char* kReceiverColumns =
    "id,name,type,cluster_id,action,actor,params,project,domain,user_id,created_at_ms,updated_at_ms";

using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StatementPtr Prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return StatementPtr(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

model::ReceiverRecord ReadRow(sqlite3_stmt* st) {
  model::ReceiverRecord r;
  r.id            = ColText(st, 0);
  r.name          = ColText(st, 1);
  r.type          = ColText(st, 2);
  r.cluster_id    = ColText(st, 3);
  r.action        = ColText(st, 4);
  r.actor_json    = ColText(st, 5);
  r.params_json   = ColText(st, 6);
  r.project       = ColText(st, 7);
  r.domain        = ColText(st, 8);
  r.user          = ColText(st, 9);
  r.created_at_ms = ColU64(st, 10);
  r.updated_at_ms = ColU64(st, 11);
  return r;
}

// Appends "AND column IN (?,?,...)" and collects the bound values.
void AppendInClause(std::string& sql, std::vector<std::string>& binds, const char* column, const std::vector<std::string>& values) {
  if (values.empty()) {
    return;
  }
  sql += " AND ";
  sql += column;
  sql += " IN (";
  for (std::size_t i = 0; i < values.size(); ++i) {
    sql += i == 0 ? "?" : ",?";
    binds.push_back(values[i]);
  }
  sql += ")";
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT: {
            const int extended = sqlite3_extended_errcode(db);
            if (extended == SQLITE_CONSTRAINT_UNIQUE || extended == SQLITE_CONSTRAINT_PRIMARYKEY)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        }
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Receivers
// ------------------------------------------------------------------

Result SqliteRepository::InsertReceiver(Transaction& t, const model::ReceiverRecord& r) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("INSERT INTO receiver(") + kReceiverColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?);";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    StatementPtr st(raw, &sqlite3_finalize);

    BindText(raw, 1, r.id);
    BindText(raw, 2, r.name);
    BindText(raw, 3, r.type);
    BindText(raw, 4, r.cluster_id);
    BindText(raw, 5, r.action);
    BindText(raw, 6, r.actor_json);
    BindText(raw, 7, r.params_json);
    BindText(raw, 8, r.project);
    BindText(raw, 9, r.domain);
    BindText(raw, 10, r.user);
    BindU64(raw, 11, r.created_at_ms);
    BindU64(raw, 12, r.updated_at_ms);

    return Translate(db, sqlite3_step(raw));
}

std::optional<model::ReceiverRecord>
SqliteRepository::GetReceiver(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, std::string("SELECT ") + kReceiverColumns + " FROM receiver WHERE id=?;");

    BindText(st.get(), 1, id);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE)
        return std::nullopt;
    if (rc != SQLITE_ROW)
        throw std::runtime_error(std::string("sqlite get receiver: ") + sqlite3_errmsg(db));

    return ReadRow(st.get());
}

std::optional<model::ReceiverRecord>
SqliteRepository::GetReceiverByName(Transaction& t, const std::string& project, const std::string& name) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, std::string("SELECT ") + kReceiverColumns + " FROM receiver WHERE project=? AND name=?;");

    BindText(st.get(), 1, project);
    BindText(st.get(), 2, name);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE)
        return std::nullopt;
    if (rc != SQLITE_ROW)
        throw std::runtime_error(std::string("sqlite get receiver by name: ") + sqlite3_errmsg(db));

    return ReadRow(st.get());
}

std::vector<model::ReceiverRecord>
SqliteRepository::ListReceivers(Transaction& t, const ReceiverFilter& filter) {
    auto* db = TX(t).Handle();

    std::string              sql = std::string("SELECT ") + kReceiverColumns + " FROM receiver WHERE 1=1";
    std::vector<std::string> binds;
    if (filter.project) {
        sql += " AND project=?";
        binds.push_back(*filter.project);
    }
    AppendInClause(sql, binds, "name", filter.names);
    AppendInClause(sql, binds, "type", filter.types);
    AppendInClause(sql, binds, "cluster_id", filter.cluster_ids);
    AppendInClause(sql, binds, "action", filter.actions);
    sql += ";";

    auto st = Prepare(db, sql);
    for (std::size_t i = 0; i < binds.size(); ++i)
        BindText(st.get(), static_cast<int>(i + 1), binds[i]);

    std::vector<model::ReceiverRecord> out;
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW)
        out.push_back(ReadRow(st.get()));

    if (rc != SQLITE_DONE)
        throw std::runtime_error(std::string("sqlite list receivers: ") + sqlite3_errmsg(db));
    return out;
}

Result SqliteRepository::DeleteReceiver(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, "DELETE FROM receiver WHERE id=?;", -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    StatementPtr st(raw, &sqlite3_finalize);

    BindText(raw, 1, id);

    auto result = Translate(db, sqlite3_step(raw));
    if (!result)
        return result;
    if (sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "receiver '" + id + "' not found");
    return Result::Ok();
}

} // namespace receiver::db::sqlite
