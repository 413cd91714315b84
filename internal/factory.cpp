#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/core/file_executors.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/model/deployment.hpp"
#include "internal/observability/logging.hpp"
#if DEPLOY_DB_SQLITE
#include "internal/db/sql/sql_queries.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace deploy::factory {

using namespace deploy;

namespace {

#if DEPLOY_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const char* sql : db::sql::SCHEMA) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT id,status,backup_id FROM transactions LIMIT 1;");
  sqlite_db->Exec("SELECT id,transaction_id,seq FROM files LIMIT 1;");
  sqlite_db->Exec("SELECT id,transaction_id,operation_type,seq FROM operations LIMIT 1;");
  sqlite_db->Exec("SELECT id,backup_path,verified FROM backups LIMIT 1;");
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const deploy::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if DEPLOY_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    BootstrapSqliteSchema(sqlite_db);
    observability::LogInfo("record store opened", {observability::StringField("sqlite", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  observability::LogInfo("record store opened", {observability::StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full deployment dependency graph
*/
Runtime BuildRuntime(const deploy::runtime::config::RuntimeConfig& config, std::shared_ptr<core::Validator> validator) {
  Runtime runtime;

  observability::InitializeLogging(config);

  // ------------------------------------------------------------------
  // Record store
  // ------------------------------------------------------------------
  runtime.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Leaf services
  // ------------------------------------------------------------------
  runtime.checksums = std::make_shared<checksum::ChecksumService>();
  runtime.archive   = std::make_shared<archive::ArchiveStore>(config.deployment().archive_directory());
  runtime.backups   = std::make_shared<backup::BackupManager>(runtime.repository, runtime.checksums, config.backup());

  // ------------------------------------------------------------------
  // Ledger + engine
  // ------------------------------------------------------------------
  runtime.ledger = std::make_shared<core::TransactionLedger>(runtime.repository, runtime.checksums);

  if (!validator) {
    validator = std::make_shared<core::BasicFileValidator>();
  }

  core::DeploymentOptions options;
  options.auto_backup  = config.backup().auto_backup();
  options.backup_type  = model::ParseBackupType(config.backup().default_type());
  options.default_user = config.deployment().default_user();

  runtime.engine = std::make_shared<core::DeploymentEngine>(runtime.ledger, runtime.backups, runtime.checksums, std::move(validator),
                                                            std::make_shared<core::CopyingFileDeployer>(runtime.archive, runtime.checksums),
                                                            std::make_shared<core::ArchiveFileRestorer>(runtime.archive), options);

  return runtime;
}

} // namespace deploy::factory
