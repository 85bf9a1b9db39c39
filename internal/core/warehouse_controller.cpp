#include "warehouse_controller.hpp"

#include <exception>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace warehouse::core {

using model::ErrorCode;
using model::Package;
using model::Result;
using model::ShipmentStatus;
using observability::IntField;
using observability::StringField;

WarehouseController::WarehouseController(std::shared_ptr<BinSource> bin_source, std::shared_ptr<UsageSink> usage_sink,
                                         std::shared_ptr<EventSink> event_sink, OptimizerOptions optimizer_options)
    : bin_source_(std::move(bin_source)),
      usage_sink_(std::move(usage_sink)),
      event_sink_(std::move(event_sink)),
      optimizer_(optimizer_options) {
}

// ------------------------------------------------------------------
// Inventory
// ------------------------------------------------------------------

std::size_t WarehouseController::LoadInventory() {
  if (!bin_source_) {
    throw std::runtime_error("no bin source configured");
  }
  return LoadInventory(bin_source_->FetchBins());
}

std::size_t WarehouseController::LoadInventory(std::vector<model::StorageBin> bins) {
  const auto offered = bins.size();
  const auto loaded  = registry_.Load(std::move(bins));
  WAREHOUSE_LOG_INFO("Inventory loaded", {IntField("bins", static_cast<std::int64_t>(loaded)), IntField("offered", static_cast<std::int64_t>(offered))});
  return loaded;
}

// ------------------------------------------------------------------
// Inbound
// ------------------------------------------------------------------

void WarehouseController::AddToConveyor(const Package& pkg) {
  conveyor_.Enqueue(pkg);
}

std::size_t WarehouseController::ConveyorSize() const {
  return conveyor_.Size();
}

ConveyorReport WarehouseController::RunConveyor() {
  ConveyorReport report;
  WAREHOUSE_LOG_INFO("Conveyor processing", {IntField("items", static_cast<std::int64_t>(conveyor_.Size()))});

  while (auto pkg = conveyor_.Dequeue()) {
    auto outcome = StorePackage(*pkg);
    if (outcome.result) {
      ++report.stored;
    } else {
      ++report.failed;
    }
    report.outcomes.push_back(std::move(outcome));
  }

  WAREHOUSE_LOG_INFO("Conveyor drained",
                     {IntField("stored", static_cast<std::int64_t>(report.stored)), IntField("failed", static_cast<std::int64_t>(report.failed))});
  return report;
}

StoreOutcome WarehouseController::StorePackage(const Package& pkg) {
  StoreOutcome outcome;
  outcome.tracking_id = pkg.tracking_id;

  if (pkg.size <= 0) {
    outcome.result = Result::Err(ErrorCode::InvalidArgument, "package size must be positive");
    WAREHOUSE_LOG_WARN("Rejected package", {StringField("tracking_id", pkg.tracking_id), IntField("size", pkg.size)});
    return outcome;
  }

  // Lookup, occupy and usage write form one step; usage reaches the sink in
  // registry order.
  std::lock_guard lock(store_mutex_);

  auto target = registry_.FindBestFit(pkg);
  if (!target) {
    outcome.result = Result::Err(ErrorCode::NoSuitableBin, "no bin can hold size " + std::to_string(pkg.size));
    WAREHOUSE_LOG_WARN("No suitable bin", {StringField("tracking_id", pkg.tracking_id), IntField("size", pkg.size)});
    return outcome;
  }

  std::int64_t used_after = 0;
  auto         occupied   = registry_.Occupy(target->BinId(), pkg.size, &used_after);
  if (!occupied) {
    outcome.result = std::move(occupied);
    WAREHOUSE_LOG_ERROR("Error storing package", {StringField("tracking_id", pkg.tracking_id), IntField("bin_id", target->BinId()),
                                                  StringField("code", model::ToString(outcome.result.code)),
                                                  StringField("error", outcome.result.message)});
    return outcome;
  }

  outcome.bin_id = target->BinId();
  outcome.result = Result::Ok();

  (void)PersistUsage(target->BinId(), used_after);
  (void)EmitEvent(pkg.tracking_id, target->BinId(), ShipmentStatus::kStored);

  WAREHOUSE_LOG_INFO("Stored package",
                     {StringField("tracking_id", pkg.tracking_id), IntField("size", pkg.size), IntField("bin_id", target->BinId()),
                      StringField("location", target->LocationCode())});
  return outcome;
}

// ------------------------------------------------------------------
// Outbound
// ------------------------------------------------------------------

LoadPlan WarehouseController::OptimizeTruckSpace(const std::vector<Package>& candidates, std::int64_t max_capacity) const {
  auto plan = optimizer_.Optimize(candidates, max_capacity);
  WAREHOUSE_LOG_INFO("Truck load optimized", {IntField("candidates", static_cast<std::int64_t>(candidates.size())), IntField("capacity", max_capacity),
                                              IntField("chosen", static_cast<std::int64_t>(plan.packages.size())), IntField("total", plan.total_size),
                                              IntField("explored_nodes", static_cast<std::int64_t>(plan.explored_nodes)),
                                              observability::BoolField("truncated", plan.truncated)});
  return plan;
}

void WarehouseController::LoadTruck(const Package& pkg) {
  truck_.Push(pkg);
  (void)EmitEvent(pkg.tracking_id, std::nullopt, ShipmentStatus::kLoaded);
  WAREHOUSE_LOG_INFO("Loaded onto truck", {StringField("tracking_id", pkg.tracking_id), IntField("size", pkg.size)});
}

LoadPlan WarehouseController::PlanAndLoadTruck(const std::vector<Package>& candidates, std::int64_t max_capacity) {
  auto plan = OptimizeTruckSpace(candidates, max_capacity);
  for (const auto& pkg : plan.packages) {
    LoadTruck(pkg);
  }
  return plan;
}

std::optional<Package> WarehouseController::UndoLastLoad() {
  auto pkg = truck_.Pop();
  if (!pkg) {
    WAREHOUSE_LOG_INFO("Truck is empty, nothing to undo", {StringField("code", model::ToString(ErrorCode::EmptyStack))});
    return std::nullopt;
  }

  (void)EmitEvent(pkg->tracking_id, std::nullopt, ShipmentStatus::kRemoved);
  WAREHOUSE_LOG_INFO("Removed from truck", {StringField("tracking_id", pkg->tracking_id)});
  return pkg;
}

// ------------------------------------------------------------------
// Collaborators
// ------------------------------------------------------------------

Result WarehouseController::EmitEvent(const std::string& tracking_id, std::optional<std::int64_t> bin_id, ShipmentStatus status) {
  if (!event_sink_) return Result::Ok();

  model::ShipmentEvent event;
  event.tracking_id = tracking_id;
  event.bin_id      = bin_id;
  event.status      = status;
  event.timestamp   = util::Now();

  try {
    event_sink_->RecordEvent(event);
    return Result::Ok();
  } catch (const std::exception& e) {
    ++sink_failures_;
    WAREHOUSE_LOG_WARN("Logging failed", {StringField("tracking_id", tracking_id), StringField("status", model::ToString(status)),
                                          StringField("code", model::ToString(ErrorCode::EventSinkFailure)), StringField("error", e.what())});
    return Result::Err(ErrorCode::EventSinkFailure, e.what());
  } catch (...) {
    ++sink_failures_;
    WAREHOUSE_LOG_WARN("Logging failed", {StringField("tracking_id", tracking_id), StringField("status", model::ToString(status)),
                                          StringField("code", model::ToString(ErrorCode::EventSinkFailure)), StringField("error", "unknown error")});
    return Result::Err(ErrorCode::EventSinkFailure, "unknown error");
  }
}

Result WarehouseController::PersistUsage(std::int64_t bin_id, std::int64_t used_space) {
  if (!usage_sink_) return Result::Ok();

  try {
    usage_sink_->RecordUsage(bin_id, used_space);
    return Result::Ok();
  } catch (const std::exception& e) {
    ++sink_failures_;
    WAREHOUSE_LOG_WARN("Usage persistence failed", {IntField("bin_id", bin_id), IntField("used", used_space),
                                                    StringField("code", model::ToString(ErrorCode::EventSinkFailure)), StringField("error", e.what())});
    return Result::Err(ErrorCode::EventSinkFailure, e.what());
  } catch (...) {
    ++sink_failures_;
    WAREHOUSE_LOG_WARN("Usage persistence failed", {IntField("bin_id", bin_id), IntField("used", used_space),
                                                    StringField("code", model::ToString(ErrorCode::EventSinkFailure)), StringField("error", "unknown error")});
    return Result::Err(ErrorCode::EventSinkFailure, "unknown error");
  }
}

} // namespace warehouse::core
