#include "internal/model/storage_bin.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <vector>

namespace {

using warehouse::model::CapacityOrder;
using warehouse::model::ErrorCode;
using warehouse::model::StorageBin;
using warehouse::model::StorageUnit;

void TestOccupyWithinCapacity() {
  StorageBin bin(1, 100, "A1");

  assert(bin.OccupySpace(40));
  assert(bin.UsedSpace() == 40);
  assert(bin.AvailableSpace() == 60);

  assert(bin.OccupySpace(60));
  assert(bin.AvailableSpace() == 0);
}

void TestOverflowIsRejectedWithoutMutation() {
  StorageBin bin(2, 50, "A2", 45);

  auto result = bin.OccupySpace(10);
  assert(!result);
  assert(result.code == ErrorCode::CapacityExceeded);
  assert(bin.UsedSpace() == 45);
}

void TestNonPositiveAmountIsRejected() {
  StorageBin bin(3, 50, "B1");

  assert(bin.OccupySpace(0).code == ErrorCode::InvalidArgument);
  assert(bin.OccupySpace(-5).code == ErrorCode::InvalidArgument);
  assert(bin.UsedSpace() == 0);
}

void TestCanHold() {
  StorageBin bin(4, 100, "B2", 90);

  assert(bin.CanHold(10));
  assert(!bin.CanHold(11));
  assert(!StorageBin(5, 20, "C1").CanHold(21));
}

void TestValidity() {
  assert(StorageBin(1, 10, "").IsValid());
  assert(!StorageBin(1, 0, "").IsValid());
  assert(!StorageBin(1, 10, "", 11).IsValid());
  assert(!StorageBin(1, 10, "", -1).IsValid());
}

void TestUsableThroughStorageUnit() {
  std::unique_ptr<StorageUnit> unit = std::make_unique<StorageBin>(6, 30, "C2");

  assert(unit->OccupySpace(30));
  assert(unit->AvailableSpace() == 0);
  assert(unit->OccupySpace(1).code == ErrorCode::CapacityExceeded);
}

void TestCapacityOrderBreaksTiesByBinId() {
  std::vector<StorageBin> bins = {{7, 100, "x"}, {3, 100, "y"}, {9, 50, "z"}};
  std::sort(bins.begin(), bins.end(), CapacityOrder{});

  assert(bins[0].BinId() == 9);
  assert(bins[1].BinId() == 3);
  assert(bins[2].BinId() == 7);
}

} // namespace

int main() {
  TestOccupyWithinCapacity();
  TestOverflowIsRejectedWithoutMutation();
  TestNonPositiveAmountIsRejected();
  TestCanHold();
  TestValidity();
  TestUsableThroughStorageUnit();
  TestCapacityOrderBreaksTiesByBinId();

  std::cout << "warehouse_unit_storage_bin: pass\n";
  return 0;
}
