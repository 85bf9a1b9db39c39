#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/observability/logging.hpp"
#if WAREHOUSE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if WAREHOUSE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace warehouse::factory {

using observability::IntField;
using observability::StringField;

namespace {

#if WAREHOUSE_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  for (const auto& sql : db::sql::PostgresSchema()) {
    tx.exec(sql);
  }
  tx.exec("SELECT bin_id,capacity,current_usage,location_code FROM bins LIMIT 1;");
  tx.exec("SELECT tracking_id,bin_id,timestamp,status FROM shipment_logs LIMIT 1;");
  tx.commit();
}
#endif

core::OptimizerOptions ToOptimizerOptions(const warehouse::runtime::config::OptimizerConfig& config) {
  core::OptimizerOptions options;
  options.max_explored_nodes = config.max_explored_nodes();
  options.max_candidates     = config.max_candidates();
  return options;
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const warehouse::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if WAREHOUSE_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sql::RunMigrations(*sqlite_db, db::sql::SqliteSchema());
    WAREHOUSE_LOG_INFO("Using sqlite repository", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if WAREHOUSE_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 4 : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    WAREHOUSE_LOG_INFO("Using postgres repository");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  WAREHOUSE_LOG_INFO("Using in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

void SeedBins(db::Repository& repository, const warehouse::runtime::config::BootstrapConfig& bootstrap) {
  auto tx = repository.Begin();

  if (bootstrap.reset_bins()) {
    db::ThrowIfDbError(repository.DeleteAllBins(*tx), "reset bins");
    WAREHOUSE_LOG_INFO("Stored bins cleared");
  }

  std::int64_t inserted = 0;
  for (const auto& seed : bootstrap.seed_bins()) {
    if (repository.GetBin(*tx, seed.bin_id())) {
      WAREHOUSE_LOG_INFO("Seed bin already stored, keeping stored usage", {IntField("bin_id", seed.bin_id())});
      continue;
    }

    db::model::BinRecord record;
    record.bin_id        = seed.bin_id();
    record.capacity      = seed.capacity();
    record.current_usage = seed.current_usage();
    record.location_code = seed.location_code();

    db::ThrowIfDbError(repository.InsertBin(*tx, record), "seed bin " + std::to_string(seed.bin_id()));
    ++inserted;
  }

  tx->Commit();
  if (bootstrap.seed_bins_size() > 0) {
    WAREHOUSE_LOG_INFO("Database seeded", {IntField("inserted", inserted), IntField("declared", bootstrap.seed_bins_size())});
  }
}

/*
    Build full application dependency graph
*/
Application Build(const warehouse::runtime::config::RuntimeConfig& config) {
  Application app;

  app.repository = BuildRepository(config);
  SeedBins(*app.repository, config.bootstrap());

  app.collaborators = std::make_shared<db::RepositoryCollaborators>(app.repository);
  app.controller    = std::make_shared<core::WarehouseController>(app.collaborators, app.collaborators, app.collaborators,
                                                                  ToOptimizerOptions(config.optimizer()));
  app.controller->LoadInventory();

  return app;
}

} // namespace warehouse::factory
