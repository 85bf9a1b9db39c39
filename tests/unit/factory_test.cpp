#include "internal/factory.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"

#if WAREHOUSE_DB_SQLITE
#include <stdexcept>

#include "internal/core/warehouse_controller.hpp"
#include "internal/db/repository_collaborators.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using warehouse::runtime::config::RuntimeConfig;

void AddSeed(RuntimeConfig& config, std::int64_t bin_id, std::int64_t capacity, const std::string& location, std::int64_t usage = 0) {
  auto* seed = config.mutable_bootstrap()->add_seed_bins();
  seed->set_bin_id(bin_id);
  seed->set_capacity(capacity);
  seed->set_current_usage(usage);
  seed->set_location_code(location);
}

RuntimeConfig DockConfig() {
  RuntimeConfig config;
  config.mutable_database()->mutable_memory();
  AddSeed(config, 1, 50, "A1");
  AddSeed(config, 2, 100, "A2");
  AddSeed(config, 3, 150, "B1");
  AddSeed(config, 4, 200, "B2");
  AddSeed(config, 5, 500, "C1");
  return config;
}

void TestBuildLoadsSeededInventory() {
  auto app = warehouse::factory::Build(DockConfig());

  assert(app.repository && app.collaborators && app.controller);
  assert(app.controller->Registry().Size() == 5);
  assert(app.controller->Registry().Get(5)->LocationCode() == "C1");
}

void TestStoredPackagesReachTheRepository() {
  auto app = warehouse::factory::Build(DockConfig());

  auto outcome = app.controller->StorePackage({"PKG_SMALL", 45, "NY"});
  assert(outcome.result);
  app.controller->LoadTruck({"BOX_A", 50, "NY"});
  assert(app.controller->SinkFailures() == 0);

  auto tx  = app.repository->Begin();
  auto bin = app.repository->GetBin(*tx, 1);
  assert(bin && bin->current_usage == 45);

  auto logs = app.repository->ListShipmentLogs(*tx);
  assert(logs.size() == 2);
  assert(logs[0].tracking_id == "PKG_SMALL");
  assert(logs[0].status == "STORED");
  assert(logs[0].bin_id == 1);
  assert(!logs[0].timestamp.empty());
  assert(logs[1].status == "LOADED");
  assert(!logs[1].bin_id.has_value());
  tx->Commit();
}

void TestSeedKeepsStoredUsageUnlessReset() {
  auto config = DockConfig();
  auto repo   = std::make_shared<warehouse::db::memory::MemoryRepository>();

  warehouse::factory::SeedBins(*repo, config.bootstrap());
  {
    auto tx = repo->Begin();
    assert(repo->UpdateBinUsage(*tx, 2, 70));
    tx->Commit();
  }

  warehouse::factory::SeedBins(*repo, config.bootstrap());
  {
    auto tx = repo->Begin();
    assert(repo->ListBins(*tx).size() == 5);
    assert(repo->GetBin(*tx, 2)->current_usage == 70);
    tx->Commit();
  }

  config.mutable_bootstrap()->set_reset_bins(true);
  config.mutable_bootstrap()->mutable_seed_bins()->RemoveLast();
  warehouse::factory::SeedBins(*repo, config.bootstrap());
  {
    auto tx = repo->Begin();
    assert(repo->ListBins(*tx).size() == 4);
    assert(repo->GetBin(*tx, 2)->current_usage == 0);
    assert(!repo->GetBin(*tx, 5).has_value());
    tx->Commit();
  }
}

void TestOptimizerLimitsAreApplied() {
  auto config = DockConfig();
  config.mutable_optimizer()->set_max_candidates(1);

  auto app  = warehouse::factory::Build(config);
  auto plan = app.controller->OptimizeTruckSpace({{"BOX_A", 50, ""}, {"BOX_B", 60, ""}}, 100);
  assert(plan.truncated);
  assert(plan.total_size == 50);
}

#if WAREHOUSE_DB_SQLITE
void TestSqliteStatePersistsAcrossRuns() {
  const auto dir = std::filesystem::temp_directory_path() / "warehouse_factory_tests";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);

  auto config = DockConfig();
  config.mutable_database()->mutable_sqlite()->set_path((dir / "warehouse.db").string());
  config.mutable_database()->mutable_sqlite()->set_wal_mode(true);

  {
    auto app = warehouse::factory::Build(config);
    assert(app.controller->StorePackage({"PKG_HUGE", 120, "CA"}).bin_id == 3);
  }

  {
    auto app = warehouse::factory::Build(config);
    assert(app.controller->Registry().Get(3)->UsedSpace() == 120);

    // Bin 3 now has 30 left, so a second huge package moves up to bin 4.
    assert(app.controller->StorePackage({"PKG_HUGE_2", 120, "CA"}).bin_id == 4);

    auto tx   = app.repository->Begin();
    auto logs = app.repository->ListShipmentLogs(*tx);
    assert(logs.size() == 2);
    assert(logs[0].tracking_id == "PKG_HUGE");
    assert(logs[1].tracking_id == "PKG_HUGE_2");
    tx->Commit();
  }

  std::filesystem::remove_all(dir);
}

// A database that was never migrated is a broken source, not an empty warehouse.
void TestSqliteWithoutSchemaFailsToLoad() {
  const auto dir = std::filesystem::temp_directory_path() / "warehouse_factory_tests";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);

  auto db            = std::make_shared<warehouse::db::sqlite::SqliteDB>((dir / "unmigrated.db").string());
  auto repository    = std::make_shared<warehouse::db::sqlite::SqliteRepository>(db);
  auto collaborators = std::make_shared<warehouse::db::RepositoryCollaborators>(repository);
  warehouse::core::WarehouseController controller(collaborators, collaborators, collaborators);

  bool threw = false;
  try {
    controller.LoadInventory();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(controller.Registry().Size() == 0);

  threw = false;
  try {
    auto tx = repository->Begin();
    repository->ListShipmentLogs(*tx);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  std::filesystem::remove_all(dir);
}
#endif

} // namespace

int main() {
  TestBuildLoadsSeededInventory();
  TestStoredPackagesReachTheRepository();
  TestSeedKeepsStoredUsageUnlessReset();
  TestOptimizerLimitsAreApplied();
#if WAREHOUSE_DB_SQLITE
  TestSqliteStatePersistsAcrossRuns();
  TestSqliteWithoutSchemaFailsToLoad();
#endif

  std::cout << "warehouse_unit_factory: pass\n";
  return 0;
}
