#include "pg_pool.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace receiver::db::postgres {

using receiver::observability::IntField;

namespace {

constexpr const char* kReceiverColumns =
    "id,name,type,cluster_id,action,actor,params,project,domain,user_id,created_at_ms,updated_at_ms";

struct Statement {
  const char* name;
  std::string sql;
};

std::vector<Statement> ReceiverStatements() {
  const std::string columns = kReceiverColumns;
  return {
      {"get_receiver", "SELECT " + columns + " FROM receiver WHERE id=$1"},
      {"get_receiver_by_name", "SELECT " + columns + " FROM receiver WHERE project=$1 AND name=$2"},
      {"insert_receiver", "INSERT INTO receiver(" + columns + ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12)"},
      {"delete_receiver", "DELETE FROM receiver WHERE id=$1"},
  };
}

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections) : PgPool(std::move(conninfo), Options{max_connections}) {
}

PgPool::PgPool(std::string conninfo, Options options) : conninfo_(std::move(conninfo)), options_(options) {
  if (options_.max_connections == 0) {
    throw std::invalid_argument("PgPool requires max_connections > 0");
  }
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);

  const auto deadline = std::chrono::steady_clock::now() + options_.acquire_timeout;
  for (;;) {
    while (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      if (conn->is_open()) {
        return Lend(std::move(conn));
      }
      --live_;
    }

    if (live_ < options_.max_connections) {
      ++live_;
      lock.unlock();
      try {
        return Lend(Connect());
      } catch (...) {
        lock.lock();
        --live_;
        returned_.notify_one();
        throw;
      }
    }

    if (!returned_.wait_until(lock, deadline, [this] { return !idle_.empty() || live_ < options_.max_connections; })) {
      RECEIVER_LOG_WARN("receiver store connection pool exhausted", {IntField("max_connections", static_cast<int64_t>(options_.max_connections))});
      throw pqxx::broken_connection("no receiver store connection available");
    }
  }
}

std::size_t PgPool::LiveConnections() const {
  std::lock_guard lock(mutex_);
  return live_;
}

std::unique_ptr<pqxx::connection> PgPool::Connect() const {
  auto conn = std::make_unique<pqxx::connection>(conninfo_);
  for (const auto& statement : ReceiverStatements()) {
    conn->prepare(statement.name, statement.sql);
  }
  return conn;
}

std::shared_ptr<pqxx::connection> PgPool::Lend(std::unique_ptr<pqxx::connection> conn) {
  std::weak_ptr<PgPool> pool = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn.release(), [pool](pqxx::connection* returned) {
    if (auto self = pool.lock()) {
      self->GiveBack(returned);
      return;
    }
    delete returned;
  });
}

void PgPool::GiveBack(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      delete conn;
      --live_;
    }
  }
  returned_.notify_one();
}

} // namespace receiver::db::postgres
