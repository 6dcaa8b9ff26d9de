#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace receiver::db::postgres {

namespace {

// Only failures worth retrying become CommitError; the rest propagate as-is.
template <typename Fn>
void TranslateTransient(const char* statement, Fn&& fn) {
  try {
    fn();
  } catch (const pqxx::serialization_failure& e) {
    throw CommitError(Result::Err(ErrorCode::SerializationFailure, std::string(statement) + ": " + e.what()));
  } catch (const pqxx::broken_connection& e) {
    throw CommitError(Result::Err(ErrorCode::IOError, std::string(statement) + ": " + e.what()));
  }
}

} // namespace

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  TranslateTransient("begin", [&] {
    conn_ = pool->Acquire();
    tx_   = std::make_unique<pqxx::work>(*conn_);
  });
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      RECEIVER_LOG_WARN("postgres rollback failed", {receiver::observability::StringField("error", e.what())});
    }
  }
}

void PgTransaction::Commit() {
  TranslateTransient("commit", [&] { tx_->commit(); });
  committed_ = true;
  finished_  = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

} // namespace receiver::db::postgres
