#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/receiver_record.hpp"
#include "internal/db/sql/migrations.hpp"

#if RECEIVER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if RECEIVER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using receiver::db::CommitError;
using receiver::db::ErrorCode;
using receiver::db::ReceiverFilter;
using receiver::db::Repository;
using receiver::db::memory::MemoryRepository;
using receiver::db::model::ReceiverRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  // write sets are checked at Commit() rather than at statement time
  bool detects_conflicts_at_commit = false;
};

ReceiverRecord MakeRecord(const std::string& id, const std::string& name, const std::string& project, const std::string& type = "webhook") {
  return ReceiverRecord{
      .id            = id,
      .name          = name,
      .type          = type,
      .cluster_id    = "c-1",
      .action        = "CLUSTER_SCALE_OUT",
      .actor_json    = R"({"trust_id":"t-)" + id + R"("})",
      .params_json   = R"({"count":"2"})",
      .project       = project,
      .domain        = "default",
      .user          = "alice",
      .created_at_ms = NowMs(),
      .updated_at_ms = NowMs(),
  };
}

void VerifyInsertGetDelete(Repository& repo, const std::string& prefix) {
  const auto record = MakeRecord(prefix + "-life", prefix + "-life-name", prefix + "-web");
  {
    auto tx = repo.Begin();
    assert(repo.InsertReceiver(*tx, record));

    // reads inside the transaction see its own write
    auto own = repo.GetReceiver(*tx, record.id);
    assert(own.has_value());
    tx->Commit();
    assert(tx->IsCommitted());
  }

  {
    auto tx      = repo.Begin();
    auto fetched = repo.GetReceiver(*tx, record.id);
    assert(fetched.has_value());
    assert(fetched->name == record.name);
    assert(fetched->type == "webhook");
    assert(fetched->actor_json == record.actor_json);
    assert(fetched->params_json == record.params_json);
    assert(fetched->created_at_ms == record.created_at_ms);

    auto by_name = repo.GetReceiverByName(*tx, record.project, record.name);
    assert(by_name.has_value());
    assert(by_name->id == record.id);
    assert(!repo.GetReceiverByName(*tx, record.project + "-other", record.name).has_value());
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(repo.DeleteReceiver(*tx, record.id));
    tx->Commit();
  }

  {
    auto tx     = repo.Begin();
    auto second = repo.DeleteReceiver(*tx, record.id);
    assert(!second);
    assert(second.code == ErrorCode::NotFound);
    assert(!repo.GetReceiver(*tx, record.id).has_value());
    tx->Rollback();
  }
}

void VerifyUniqueness(Repository& repo, const std::string& prefix) {
  const auto original = MakeRecord(prefix + "-uniq", prefix + "-uniq-name", prefix + "-web");
  {
    auto tx = repo.Begin();
    assert(repo.InsertReceiver(*tx, original));
    tx->Commit();
  }

  {
    auto tx     = repo.Begin();
    auto result = repo.InsertReceiver(*tx, MakeRecord(original.id, prefix + "-uniq-other", prefix + "-web"));
    assert(result.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  {
    auto tx     = repo.Begin();
    auto result = repo.InsertReceiver(*tx, MakeRecord(prefix + "-uniq-2", original.name, original.project));
    assert(result.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  {
    // the same name in another project is a different receiver
    auto tx = repo.Begin();
    assert(repo.InsertReceiver(*tx, MakeRecord(prefix + "-uniq-3", original.name, prefix + "-ops")));
    tx->Commit();
  }
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  const auto record = MakeRecord(prefix + "-rollback", prefix + "-rollback-name", prefix + "-web");
  {
    auto tx = repo.Begin();
    assert(repo.InsertReceiver(*tx, record));
    tx->Rollback();
  }
  {
    // destructor without commit also discards
    auto tx = repo.Begin();
    assert(repo.InsertReceiver(*tx, record));
  }

  auto tx = repo.Begin();
  assert(!repo.GetReceiver(*tx, record.id).has_value());
  assert(!repo.GetReceiverByName(*tx, record.project, record.name).has_value());
  tx->Commit();
}

void VerifyListFilters(Repository& repo, const std::string& prefix) {
  const auto web = prefix + "-list-web";
  const auto ops = prefix + "-list-ops";
  {
    auto tx = repo.Begin();
    assert(repo.InsertReceiver(*tx, MakeRecord(prefix + "-l1", "alpha", web, "webhook")));
    assert(repo.InsertReceiver(*tx, MakeRecord(prefix + "-l2", "bravo", web, "signal")));
    auto other = MakeRecord(prefix + "-l3", "alpha", ops, "webhook");
    other.action = "CLUSTER_SCALE_IN";
    assert(repo.InsertReceiver(*tx, other));
    tx->Commit();
  }

  auto tx = repo.Begin();

  ReceiverFilter by_project{.project = web};
  assert(repo.ListReceivers(*tx, by_project).size() == 2);

  ReceiverFilter by_type{.project = web, .types = {"signal"}};
  auto           signals = repo.ListReceivers(*tx, by_type);
  assert(signals.size() == 1);
  assert(signals[0].name == "bravo");

  ReceiverFilter by_name{.names = {"alpha"}};
  std::size_t    alphas = 0;
  for (const auto& record : repo.ListReceivers(*tx, by_name)) {
    if (record.project == web || record.project == ops) ++alphas;
  }
  assert(alphas == 2);

  ReceiverFilter by_action{.project = ops, .actions = {"CLUSTER_SCALE_IN", "CLUSTER_RESIZE"}};
  assert(repo.ListReceivers(*tx, by_action).size() == 1);

  ReceiverFilter nothing{.project = web, .cluster_ids = {"c-unknown"}};
  assert(repo.ListReceivers(*tx, nothing).empty());
  tx->Commit();
}

void VerifyConflictingCommits(Repository& repo, const std::string& prefix, bool detects_conflicts_at_commit) {
  if (!detects_conflicts_at_commit) {
    return;
  }

  const auto project = prefix + "-race";
  auto       first   = repo.Begin();
  auto       second  = repo.Begin();

  assert(repo.InsertReceiver(*first, MakeRecord(prefix + "-race-1", "same-name", project)));
  // the second snapshot does not see the first, uncommitted insert
  assert(repo.InsertReceiver(*second, MakeRecord(prefix + "-race-2", "same-name", project)));

  first->Commit();

  bool conflicted = false;
  try {
    second->Commit();
  } catch (const CommitError& e) {
    conflicted = e.result().code == ErrorCode::AlreadyExists;
  }
  assert(conflicted);

  auto deleter_a = repo.Begin();
  auto deleter_b = repo.Begin();
  assert(repo.DeleteReceiver(*deleter_a, prefix + "-race-1"));
  assert(repo.DeleteReceiver(*deleter_b, prefix + "-race-1"));
  deleter_a->Commit();

  conflicted = false;
  try {
    deleter_b->Commit();
  } catch (const CommitError& e) {
    conflicted = e.result().code == ErrorCode::NotFound;
  }
  assert(conflicted);

  auto check = repo.Begin();
  assert(!repo.GetReceiver(*check, prefix + "-race-2").has_value());
  assert(!repo.GetReceiverByName(*check, project, "same-name").has_value());
  check->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto       repo   = backend.make_repository();
  const auto record = MakeRecord(prefix + "-durable", prefix + "-durable-name", prefix + "-web", "signal");
  {
    auto tx = repo->Begin();
    assert(repo->InsertReceiver(*tx, record));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto r  = repo->GetReceiver(*tx, record.id);
  assert(r.has_value());
  assert(r->type == "signal");
  assert(r->actor_json == record.actor_json);
  assert(r->updated_at_ms == record.updated_at_ms);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                        = "memory",
      .make_repository             = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart            = []() { return false; },
      .restart                     = [](std::shared_ptr<Repository>&) {},
      .cleanup                     = []() {},
      .detects_conflicts_at_commit = true,
  };
}

#if RECEIVER_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("receiver_manager_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<receiver::db::sqlite::SqliteDB>(db_path);
    receiver::db::sql::RunMigrations(*db, receiver::db::sql::SqliteMigrations());
    return std::make_shared<receiver::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                        = "sqlite",
      .make_repository             = make_repo,
      .supports_restart            = []() { return true; },
      .restart                     = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup                     = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
      .detects_conflicts_at_commit = false,
  };
}
#endif

#if RECEIVER_DB_POSTGRES
class PgMigrationExecutor final : public receiver::db::sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(std::shared_ptr<pqxx::connection> conn) : conn_(std::move(conn)) {
  }

  void ExecuteSQL(const std::string& sql) override {
    pqxx::work tx(*conn_);
    tx.exec(sql);
    tx.commit();
  }

 private:
  std::shared_ptr<pqxx::connection> conn_;
};

BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("RECEIVER_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("RECEIVER_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<receiver::db::postgres::PgPool>(conninfo);
    {
      PgMigrationExecutor executor(pool->Acquire());
      receiver::db::sql::RunMigrations(executor, receiver::db::sql::PostgresMigrations());
    }
    return std::make_shared<receiver::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name                        = "postgres",
      .make_repository             = make_repo,
      .supports_restart            = []() { return true; },
      .restart                     = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                     = []() {},
      .detects_conflicts_at_commit = false,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // unique per run so a persistent database can be reused
  const auto prefix = backend.name + "-" + std::to_string(NowMs());

  VerifyInsertGetDelete(*repo, prefix);
  VerifyUniqueness(*repo, prefix);
  VerifyRollbackBehavior(*repo, prefix);
  VerifyListFilters(*repo, prefix);
  VerifyConflictingCommits(*repo, prefix, backend.detects_conflicts_at_commit);

  repo.reset();
  VerifyRestartDurability(backend, prefix);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if RECEIVER_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if RECEIVER_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "receiver_manager_integration_repository_parity: pass\n";
  return 0;
}
