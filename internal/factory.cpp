#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/cluster/cluster_registry.hpp"
#include "internal/core/channel_allocator.hpp"
#include "internal/core/receiver_manager.hpp"
#include "internal/core/trigger_dispatcher.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/engine/action_scheduler.hpp"
#include "internal/engine/action_worker.hpp"
#include "internal/engine/local_action_engine.hpp"
#include "internal/grpc/receiver_server.hpp"
#include "internal/grpc/trigger_server.hpp"
#include "internal/identity/credential_delegator.hpp"
#include "internal/identity/local_identity_service.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/receiver_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/trigger_service.hpp"
#if RECEIVER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if RECEIVER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace receiver::factory {

using receiver::observability::IntField;
using receiver::observability::StringField;

namespace {

#if RECEIVER_DB_POSTGRES
class PgMigrationExecutor final : public db::sql::MigrationExecutor {
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
#endif

std::shared_ptr<db::Repository> BuildRepository(const receiver::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if RECEIVER_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(),
                                                            std::chrono::milliseconds(database.sqlite().busy_timeout_ms()));
    db::sql::RunMigrations(*sqlite_db, db::sql::SqliteMigrations());
    RECEIVER_LOG_INFO("sqlite receiver store ready", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if RECEIVER_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 16 : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    {
      PgMigrationExecutor executor(pool->Acquire());
      db::sql::RunMigrations(executor, db::sql::PostgresMigrations());
    }
    RECEIVER_LOG_INFO("postgres receiver store ready", {IntField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  RECEIVER_LOG_WARN("using in-memory receiver store; receivers are lost on restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<identity::LocalIdentityService> BuildIdentity(const receiver::runtime::config::IdentityConfig& config) {
  auto identity = std::make_shared<identity::LocalIdentityService>(std::chrono::seconds(config.trust_ttl_seconds()));
  for (const auto& user : config.users()) {
    identity::LocalIdentityService::User entry;
    entry.context.user    = user.user();
    entry.context.project = user.project();
    entry.context.domain  = user.domain();
    entry.context.roles.assign(user.roles().begin(), user.roles().end());
    entry.can_delegate = user.can_delegate();
    identity->AddUser(user.token(), entry);
  }
  return identity;
}

std::shared_ptr<cluster::StaticClusterRegistry> BuildClusters(const receiver::runtime::config::RuntimeConfig& config) {
  auto clusters = std::make_shared<cluster::StaticClusterRegistry>();
  for (const auto& entry : config.clusters()) {
    clusters->Add(cluster::Cluster{entry.id(), entry.name(), entry.project()});
  }
  return clusters;
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const receiver::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  auto repository       = BuildRepository(config);
  auto identity_service = BuildIdentity(config.identity());
  auto clusters         = BuildClusters(config);
  auto delegator =
      std::make_shared<identity::CredentialDelegator>(identity_service, std::chrono::milliseconds(config.identity().call_timeout_ms()));

  // ------------------------------------------------------------------
  // Action engine
  // ------------------------------------------------------------------
  engine::LocalActionEngine::Options engine_options;
  engine_options.actions.assign(config.engine().actions().begin(), config.engine().actions().end());
  engine_options.max_pending_per_cluster = config.engine().max_pending_per_cluster();

  auto scheduler     = std::make_shared<engine::ActionScheduler>();
  auto action_engine = std::make_shared<engine::LocalActionEngine>(clusters, scheduler, engine_options);
  app.action_engine  = action_engine;

  for (uint32_t i = 0; i < config.engine().worker_threads(); ++i) {
    auto worker = std::make_shared<engine::ActionWorker>(scheduler, action_engine);
    worker->Start();
    // Keep ownership of workers so they live for process lifetime
    app.background_workers.push_back(worker);
  }

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto channels = std::make_shared<core::ChannelAllocator>(config.channel().base_url());

  core::ReceiverManager::Options manager_options;
  manager_options.default_limit = config.api().default_limit();
  manager_options.max_limit     = config.api().max_limit();

  auto manager    = std::make_shared<core::ReceiverManager>(repository, clusters, action_engine, delegator, channels, manager_options);
  auto dispatcher = std::make_shared<core::TriggerDispatcher>(manager, clusters, action_engine, delegator);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.manager    = manager;
  ctx.dispatcher = dispatcher;
  ctx.engine     = action_engine;
  ctx.delegator  = delegator;

  auto receiver_service = std::make_shared<service::ReceiverService>(ctx);
  auto trigger_service  = std::make_shared<service::TriggerService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::ReceiverServer>(receiver_service));
  app.grpc_services.push_back(std::make_unique<grpc::TriggerServer>(trigger_service));

  RECEIVER_LOG_INFO("receiver manager assembled", {IntField("clusters", config.clusters_size()), IntField("users", config.identity().users_size()),
                                                   IntField("workers", config.engine().worker_threads()),
                                                   StringField("channel_base_url", channels->BaseUrl())});
  return app;
}

} // namespace receiver::factory
