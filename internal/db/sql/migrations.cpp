#include "migrations.hpp"

#include <stdexcept>

namespace receiver::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (std::size_t i = 0; i < ordered_sql.size(); ++i) {
    try {
      executor.ExecuteSQL(ordered_sql[i]);
    } catch (const std::exception& e) {
      throw std::runtime_error("migration " + std::to_string(i) + " failed: " + e.what());
    }
  }
}

const std::vector<std::string>& SqliteMigrations() {
  static const std::vector<std::string> kSql = {
      "CREATE TABLE IF NOT EXISTS receiver (id TEXT PRIMARY KEY, name TEXT NOT NULL, type TEXT NOT NULL, cluster_id TEXT NOT NULL, action TEXT NOT "
      "NULL, actor TEXT NOT NULL, params TEXT NOT NULL, project TEXT NOT NULL, domain TEXT NOT NULL, user_id TEXT NOT NULL, created_at_ms INTEGER "
      "NOT NULL, updated_at_ms INTEGER NOT NULL, UNIQUE(project, name));",
      "CREATE INDEX IF NOT EXISTS receiver_project_idx ON receiver(project);",
      "CREATE TABLE IF NOT EXISTS receiver_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
      "INSERT OR IGNORE INTO receiver_schema_migrations(version, applied_at_ms) VALUES (1, CAST(strftime('%s','now') AS INTEGER) * 1000);"};
  return kSql;
}

const std::vector<std::string>& PostgresMigrations() {
  static const std::vector<std::string> kSql = {
      "CREATE TABLE IF NOT EXISTS receiver (id TEXT PRIMARY KEY, name TEXT NOT NULL, type TEXT NOT NULL, cluster_id TEXT NOT NULL, action TEXT NOT "
      "NULL, actor TEXT NOT NULL, params TEXT NOT NULL, project TEXT NOT NULL, domain TEXT NOT NULL, user_id TEXT NOT NULL, created_at_ms BIGINT "
      "NOT NULL, updated_at_ms BIGINT NOT NULL, UNIQUE(project, name));",
      "CREATE INDEX IF NOT EXISTS receiver_project_idx ON receiver(project);",
      "CREATE TABLE IF NOT EXISTS receiver_schema_migrations (version INTEGER PRIMARY KEY, applied_at TIMESTAMPTZ DEFAULT NOW());",
      "INSERT INTO receiver_schema_migrations(version) VALUES (1) ON CONFLICT DO NOTHING;"};
  return kSql;
}

} // namespace receiver::db::sql
