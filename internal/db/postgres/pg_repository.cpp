#include "pg_repository.hpp"

namespace receiver::db::postgres {

namespace {

model::ReceiverRecord ReadRow(const pqxx::row& row) {
  model::ReceiverRecord r;
  r.id            = row[0].c_str();
  r.name          = row[1].c_str();
  r.type          = row[2].c_str();
  r.cluster_id    = row[3].c_str();
  r.action        = row[4].c_str();
  r.actor_json    = row[5].c_str();
  r.params_json   = row[6].c_str();
  r.project       = row[7].c_str();
  r.domain        = row[8].c_str();
  r.user          = row[9].c_str();
  r.created_at_ms = row[10].as<uint64_t>();
  r.updated_at_ms = row[11].as<uint64_t>();
  return r;
}

void AppendInClause(pqxx::work& w, std::string& sql, const char* column, const std::vector<std::string>& values) {
  if (values.empty()) {
    return;
  }
  sql += " AND ";
  sql += column;
  sql += " IN (";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i != 0) sql += ",";
    sql += w.quote(values[i]);
  }
  sql += ")";
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::InsertReceiver(Transaction& t, const model::ReceiverRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_receiver", r.id, r.name, r.type, r.cluster_id, r.action, r.actor_json, r.params_json, r.project, r.domain,
                               r.user, r.created_at_ms, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ReceiverRecord> PgRepository::GetReceiver(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_receiver", id);
  if (res.empty()) return std::nullopt;
  return ReadRow(res[0]);
}

std::optional<model::ReceiverRecord> PgRepository::GetReceiverByName(Transaction& t, const std::string& project, const std::string& name) {
  auto res = TX(t).Work().exec_prepared("get_receiver_by_name", project, name);
  if (res.empty()) return std::nullopt;
  return ReadRow(res[0]);
}

std::vector<model::ReceiverRecord> PgRepository::ListReceivers(Transaction& t, const ReceiverFilter& filter) {
  auto& w = TX(t).Work();

  std::string sql = "SELECT id,name,type,cluster_id,action,actor,params,project,domain,user_id,created_at_ms,updated_at_ms FROM receiver WHERE TRUE";
  if (filter.project) {
    sql += " AND project=" + w.quote(*filter.project);
  }
  AppendInClause(w, sql, "name", filter.names);
  AppendInClause(w, sql, "type", filter.types);
  AppendInClause(w, sql, "cluster_id", filter.cluster_ids);
  AppendInClause(w, sql, "action", filter.actions);

  auto res = w.exec(sql);

  std::vector<model::ReceiverRecord> records;
  records.reserve(res.size());
  for (const auto& row : res) {
    records.push_back(ReadRow(row));
  }
  return records;
}

Result PgRepository::DeleteReceiver(Transaction& t, const std::string& id) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_receiver", id);
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::NotFound, "receiver '" + id + "' not found");
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace receiver::db::postgres
