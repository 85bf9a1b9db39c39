#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using warehouse::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "warehouse_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

void TestFullRuntimeConfig() {
  const auto yaml_path = WriteYaml("full_runtime",
                                   R"(logging:
  level: debug
  pattern: "%v"
database:
  sqlite:
    path: "/tmp/warehouse.db"
    wal_mode: true
bootstrap:
  reset_bins: true
  seed_bins:
    - bin_id: 1
      capacity: 50
      location_code: "A1"
    - bin_id: 2
      capacity: 100
      current_usage: 25
      location_code: "A2"
optimizer:
  max_explored_nodes: 100000
  max_candidates: 24
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/tmp/warehouse.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.bootstrap().reset_bins());
  assert(config.bootstrap().seed_bins_size() == 2);
  assert(config.bootstrap().seed_bins(1).capacity() == 100);
  assert(config.bootstrap().seed_bins(1).current_usage() == 25);
  assert(config.bootstrap().seed_bins(0).current_usage() == 0);
  assert(config.optimizer().max_explored_nodes() == 100000);
  assert(config.optimizer().max_candidates() == 24);
}

void TestMemoryBackendWithoutBootstrap() {
  const auto yaml_path = WriteYaml("memory_only",
                                   R"(database:
  memory: {}
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_memory());
  assert(config.bootstrap().seed_bins_size() == 0);
  assert(config.optimizer().max_explored_nodes() == 0);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\warehouse\\\"quoted\"\\db.sqlite"
    wal_mode: false
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\warehouse\\\"quoted\"\\db.sqlite");
}

void TestQuotedNumbersStayStrings() {
  const auto yaml_path = WriteYaml("quoted_numbers",
                                   R"(inbound:
  - tracking_id: "007"
    size: 12
    destination: "10001"
)");

  auto manifest = ConfigLoader::LoadManifestFromYaml(yaml_path.string());
  assert(manifest.inbound_size() == 1);
  assert(manifest.inbound(0).tracking_id() == "007");
  assert(manifest.inbound(0).destination() == "10001");
  assert(manifest.inbound(0).size() == 12);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  memory: {}
conveyor_speed: 123
)");

  bool threw = Throws<std::runtime_error>([&] { (void)ConfigLoader::LoadFromYaml(yaml_path.string()); });
  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = Throws<std::runtime_error>([] { (void)ConfigLoader::LoadFromYaml("/nonexistent/warehouse.yaml"); });
  assert(threw);
}

void TestInvalidSeedBinsAreRejected() {
  const auto zero_capacity = WriteYaml("seed_zero_capacity",
                                       R"(bootstrap:
  seed_bins:
    - bin_id: 1
      capacity: 0
)");
  assert(Throws<warehouse::util::InvalidArgument>([&] { (void)ConfigLoader::LoadFromYaml(zero_capacity.string()); }));

  const auto over_full = WriteYaml("seed_over_full",
                                   R"(bootstrap:
  seed_bins:
    - bin_id: 1
      capacity: 10
      current_usage: 11
)");
  assert(Throws<warehouse::util::InvalidArgument>([&] { (void)ConfigLoader::LoadFromYaml(over_full.string()); }));

  const auto duplicate = WriteYaml("seed_duplicate",
                                   R"(bootstrap:
  seed_bins:
    - bin_id: 4
      capacity: 10
    - bin_id: 4
      capacity: 20
)");
  assert(Throws<warehouse::util::AlreadyExists>([&] { (void)ConfigLoader::LoadFromYaml(duplicate.string()); }));
}

void TestEmptySqlitePathIsRejected() {
  const auto yaml_path = WriteYaml("empty_sqlite_path",
                                   R"(database:
  sqlite:
    path: ""
)");
  assert(Throws<warehouse::util::InvalidArgument>([&] { (void)ConfigLoader::LoadFromYaml(yaml_path.string()); }));
}

void TestShiftManifest() {
  const auto yaml_path = WriteYaml("shift_manifest",
                                   R"(inbound:
  - tracking_id: PKG_SMALL
    size: 45
    destination: NY
  - tracking_id: PKG_HUGE
    size: 120
    destination: CA
truck:
  capacity: 100
  undo_last: 1
  candidates:
    - tracking_id: BOX_A
      size: 50
    - tracking_id: BOX_B
      size: 60
)");

  auto manifest = ConfigLoader::LoadManifestFromYaml(yaml_path.string());
  assert(manifest.inbound_size() == 2);
  assert(manifest.inbound(1).tracking_id() == "PKG_HUGE");
  assert(manifest.truck().capacity() == 100);
  assert(manifest.truck().undo_last() == 1);
  assert(manifest.truck().candidates_size() == 2);
  assert(manifest.truck().candidates(0).destination().empty());
}

void TestInvalidManifestsAreRejected() {
  const auto zero_size = WriteYaml("manifest_zero_size",
                                   R"(inbound:
  - tracking_id: PKG
    size: 0
)");
  assert(Throws<warehouse::util::InvalidArgument>([&] { (void)ConfigLoader::LoadManifestFromYaml(zero_size.string()); }));

  const auto missing_id = WriteYaml("manifest_missing_id",
                                    R"(truck:
  capacity: 10
  candidates:
    - size: 5
)");
  assert(Throws<warehouse::util::InvalidArgument>([&] { (void)ConfigLoader::LoadManifestFromYaml(missing_id.string()); }));

  const auto duplicate = WriteYaml("manifest_duplicate",
                                   R"(inbound:
  - tracking_id: PKG
    size: 1
  - tracking_id: PKG
    size: 2
)");
  assert(Throws<warehouse::util::AlreadyExists>([&] { (void)ConfigLoader::LoadManifestFromYaml(duplicate.string()); }));

  const auto negative_truck = WriteYaml("manifest_negative_truck",
                                        R"(truck:
  capacity: -1
)");
  assert(Throws<warehouse::util::InvalidArgument>([&] { (void)ConfigLoader::LoadManifestFromYaml(negative_truck.string()); }));
}

} // namespace

int main() {
  TestFullRuntimeConfig();
  TestMemoryBackendWithoutBootstrap();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();
  TestInvalidSeedBinsAreRejected();
  TestEmptySqlitePathIsRejected();
  TestShiftManifest();
  TestInvalidManifestsAreRejected();

  std::cout << "warehouse_unit_config_loader: pass\n";
  return 0;
}
