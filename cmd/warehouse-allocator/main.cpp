#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

using warehouse::observability::BoolField;
using warehouse::observability::IntField;
using warehouse::observability::StringField;

namespace {

void Usage() {
  std::cerr << "Usage: warehouse-allocator --config <config.yaml> [--manifest <manifest.yaml>]\n"
            << "       warehouse-allocator <config.yaml> [<manifest.yaml>]" << std::endl;
}

struct Arguments {
  std::string                config_path;
  std::optional<std::string> manifest_path;
};

std::optional<Arguments> ParseArguments(int argc, char** argv) {
  Arguments                args;
  std::vector<std::string> positional;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if (arg == "--manifest" && i + 1 < argc) {
      args.manifest_path = argv[++i];
    } else if (!arg.empty() && arg[0] == '-') {
      return std::nullopt;
    } else {
      positional.push_back(arg);
    }
  }

  if (args.config_path.empty() && !positional.empty()) {
    args.config_path = positional.front();
    positional.erase(positional.begin());
  }
  if (!args.manifest_path && !positional.empty()) {
    args.manifest_path = positional.front();
    positional.erase(positional.begin());
  }

  if (args.config_path.empty() || !positional.empty()) {
    return std::nullopt;
  }
  return args;
}

std::vector<warehouse::model::Package> ToPackages(const google::protobuf::RepeatedPtrField<warehouse::runtime::manifest::PackageSpec>& specs) {
  std::vector<warehouse::model::Package> packages;
  packages.reserve(specs.size());
  for (const auto& spec : specs) {
    packages.push_back({spec.tracking_id(), spec.size(), spec.destination()});
  }
  return packages;
}

void RunShift(warehouse::core::WarehouseController& controller, const warehouse::runtime::manifest::Manifest& manifest) {
  // 1. Inbound
  for (const auto& pkg : ToPackages(manifest.inbound())) {
    controller.AddToConveyor(pkg);
  }
  controller.RunConveyor();

  // 2. Outbound
  if (manifest.truck().candidates_size() > 0) {
    const auto plan = controller.PlanAndLoadTruck(ToPackages(manifest.truck().candidates()), manifest.truck().capacity());
    WAREHOUSE_LOG_INFO("Truck plan", {IntField("packages", static_cast<std::int64_t>(plan.packages.size())), IntField("total", plan.total_size),
                                      IntField("capacity", manifest.truck().capacity()), BoolField("truncated", plan.truncated)});
  }

  // 3. Corrections
  for (std::uint32_t i = 0; i < manifest.truck().undo_last(); ++i) {
    if (!controller.UndoLastLoad()) break;
  }

  for (const auto& bin : controller.Registry().Snapshot()) {
    WAREHOUSE_LOG_INFO("Bin", {IntField("bin_id", bin.BinId()), StringField("location", bin.LocationCode()), IntField("capacity", bin.Capacity()),
                               IntField("used", bin.UsedSpace())});
  }
  for (const auto& pkg : controller.Truck().Contents()) {
    WAREHOUSE_LOG_INFO("On truck", {StringField("tracking_id", pkg.tracking_id), IntField("size", pkg.size), StringField("destination", pkg.destination)});
  }
}

} // namespace

int main(int argc, char** argv) {
  const auto args = ParseArguments(argc, argv);
  if (!args) {
    Usage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = warehouse::config::ConfigLoader::LoadFromYaml(args->config_path);
    warehouse::observability::InitializeLogging(config);

    std::optional<warehouse::runtime::manifest::Manifest> manifest;
    if (args->manifest_path) {
      manifest = warehouse::config::ConfigLoader::LoadManifestFromYaml(*args->manifest_path);
    }

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = warehouse::factory::Build(config);
    WAREHOUSE_LOG_INFO("Warehouse allocator ready", {IntField("bins", static_cast<std::int64_t>(app.controller->Registry().Size()))});

    if (manifest) {
      RunShift(*app.controller, *manifest);
    }

    if (app.controller->SinkFailures() > 0) {
      WAREHOUSE_LOG_WARN("Some events were not persisted", {IntField("failures", static_cast<std::int64_t>(app.controller->SinkFailures()))});
    }
    warehouse::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    WAREHOUSE_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    warehouse::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
