#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/bin_registry.hpp"
#include "internal/core/collaborators.hpp"
#include "internal/core/conveyor_queue.hpp"
#include "internal/core/truck_load_optimizer.hpp"
#include "internal/core/truck_load_stack.hpp"
#include "internal/model/package.hpp"
#include "internal/model/result.hpp"

namespace warehouse::core {

struct StoreOutcome {
  std::string                 tracking_id;
  std::optional<std::int64_t> bin_id;
  model::Result               result;
};

struct ConveyorReport {
  std::vector<StoreOutcome> outcomes; // arrival order
  std::size_t               stored = 0;
  std::size_t               failed = 0;
};

/*
  Owns the in-memory warehouse state for one run and wires it to the
  durable collaborators.

  Inbound:  AddToConveyor -> RunConveyor -> best-fit bin -> usage + STORED event
  Outbound: OptimizeTruckSpace -> LoadTruck (LOADED) -> UndoLastLoad (REMOVED)

  Collaborator failures (usage sink, event sink) are logged and swallowed,
  whatever the sink throws: the in-memory mutation that triggered them stands.

  One controller may be shared between threads. Stores are serialized so the
  usage handed to the sink always matches the registry at that point.
*/
class WarehouseController {
 public:
  WarehouseController(std::shared_ptr<BinSource> bin_source, std::shared_ptr<UsageSink> usage_sink, std::shared_ptr<EventSink> event_sink,
                      OptimizerOptions optimizer_options = {});

  // Reloads the registry from the bin source. Source errors propagate.
  std::size_t LoadInventory();
  std::size_t LoadInventory(std::vector<model::StorageBin> bins);

  void        AddToConveyor(const model::Package& pkg);
  std::size_t ConveyorSize() const;

  // Drains the conveyor in arrival order; one failure never stops the batch.
  ConveyorReport RunConveyor();

  // Allocates a single package to its best-fit bin.
  StoreOutcome StorePackage(const model::Package& pkg);

  LoadPlan OptimizeTruckSpace(const std::vector<model::Package>& candidates, std::int64_t max_capacity) const;

  void LoadTruck(const model::Package& pkg);

  // Optimizes, then loads the chosen packages in input order.
  LoadPlan PlanAndLoadTruck(const std::vector<model::Package>& candidates, std::int64_t max_capacity);

  // nullopt (EmptyStack) when the truck is empty.
  std::optional<model::Package> UndoLastLoad();

  const BinRegistry& Registry() const {
    return registry_;
  }
  const TruckLoadStack& Truck() const {
    return truck_;
  }

  // Collaborator writes that failed and were swallowed.
  std::uint64_t SinkFailures() const {
    return sink_failures_.load();
  }

 private:
  model::Result EmitEvent(const std::string& tracking_id, std::optional<std::int64_t> bin_id, model::ShipmentStatus status);
  model::Result PersistUsage(std::int64_t bin_id, std::int64_t used_space);

  std::shared_ptr<BinSource> bin_source_;
  std::shared_ptr<UsageSink> usage_sink_;
  std::shared_ptr<EventSink> event_sink_;

  BinRegistry        registry_;
  ConveyorQueue      conveyor_;
  TruckLoadStack     truck_;
  TruckLoadOptimizer optimizer_;

  std::mutex                 store_mutex_;
  std::atomic<std::uint64_t> sink_failures_{0};
};

} // namespace warehouse::core
