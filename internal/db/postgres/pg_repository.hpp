#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace receiver::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertReceiver(Transaction&, const model::ReceiverRecord&) override;
  std::optional<model::ReceiverRecord> GetReceiver(Transaction&, const std::string&) override;
  std::optional<model::ReceiverRecord> GetReceiverByName(Transaction&, const std::string& project, const std::string& name) override;
  std::vector<model::ReceiverRecord> ListReceivers(Transaction&, const ReceiverFilter&) override;
  Result DeleteReceiver(Transaction&, const std::string&) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
