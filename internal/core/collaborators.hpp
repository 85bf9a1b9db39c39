#pragma once

#include <cstdint>
#include <vector>

#include "internal/model/shipment_event.hpp"
#include "internal/model/storage_bin.hpp"

namespace warehouse::core {

/*
  Boundaries between the allocation core and durable storage.

  The core only talks to these; factory.cpp decides what sits behind them
  (see db::RepositoryCollaborators). Implementations report failure by
  throwing; the controller catches, logs and keeps its in-memory state.
*/

class BinSource {
 public:
  virtual ~BinSource() = default;

  // Full bin set, in any order.
  virtual std::vector<model::StorageBin> FetchBins() = 0;
};

class UsageSink {
 public:
  virtual ~UsageSink() = default;

  virtual void RecordUsage(std::int64_t bin_id, std::int64_t used_space) = 0;
};

class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual void RecordEvent(const model::ShipmentEvent& event) = 0;
};

} // namespace warehouse::core
