#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace receiver::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertReceiver(Transaction&, const model::ReceiverRecord&) override;
  std::optional<model::ReceiverRecord> GetReceiver(Transaction&, const std::string&) override;
  std::optional<model::ReceiverRecord> GetReceiverByName(Transaction&, const std::string& project, const std::string& name) override;
  std::vector<model::ReceiverRecord> ListReceivers(Transaction&, const ReceiverFilter&) override;
  Result DeleteReceiver(Transaction&, const std::string&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
