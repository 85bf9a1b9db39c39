#include "internal/core/bin_registry.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <optional>
#include <vector>

namespace {

using warehouse::core::BinRegistry;
using warehouse::model::ErrorCode;
using warehouse::model::Package;
using warehouse::model::StorageBin;

Package Pkg(const char* id, std::int64_t size) {
  return Package{id, size, "NY"};
}

std::vector<StorageBin> DockInventory() {
  return {
      {1, 50, "A1"}, {2, 100, "A2"}, {3, 150, "B1"}, {4, 200, "B2"}, {5, 500, "C1"},
  };
}

// Stores the package where FindBestFit points, the way the controller does.
std::optional<std::int64_t> Store(BinRegistry& registry, const Package& pkg) {
  auto bin = registry.FindBestFit(pkg);
  if (!bin) return std::nullopt;
  assert(registry.Occupy(bin->BinId(), pkg.size));
  return bin->BinId();
}

void TestShiftAllocation() {
  BinRegistry registry;
  assert(registry.Load(DockInventory()) == 5);

  assert(Store(registry, Pkg("PKG_SMALL", 45)) == 1);
  assert(Store(registry, Pkg("PKG_HUGE", 120)) == 3);
  // Bin 1 has 5 left and bin 3 has 30 left; the search settles on bin 2.
  assert(Store(registry, Pkg("PKG_MID", 30)) == 2);

  assert(registry.Get(1)->UsedSpace() == 45);
  assert(registry.Get(2)->UsedSpace() == 30);
  assert(registry.Get(3)->UsedSpace() == 120);
}

void TestOversizedPackageHasNoBin() {
  BinRegistry registry;
  registry.Load(DockInventory());

  assert(!registry.FindBestFit(Pkg("PKG_XL", 501)).has_value());

  BinRegistry empty;
  assert(!empty.FindBestFit(Pkg("PKG_ANY", 1)).has_value());
}

void TestEqualCapacityPicksTheBinWithRoom() {
  {
    BinRegistry registry;
    registry.Load({{10, 100, "D1", 90}, {11, 100, "D2", 0}});
    auto bin = registry.FindBestFit(Pkg("PKG_D", 50));
    assert(bin && bin->BinId() == 11);
  }
  {
    BinRegistry registry;
    registry.Load({{10, 100, "D1", 0}, {11, 100, "D2", 90}});
    auto bin = registry.FindBestFit(Pkg("PKG_D", 50));
    assert(bin && bin->BinId() == 10);
  }
}

void TestEqualCapacityTieSettlesLeftOfFirstMidpoint() {
  BinRegistry registry;
  registry.Load({{3, 100, "E3"}, {1, 100, "E1"}, {2, 100, "E2"}});

  auto bin = registry.FindBestFit(Pkg("PKG_E", 10));
  assert(bin && bin->BinId() == 1);
}

void TestNarrowingSkipsBinBehindFullerMidpoint() {
  // Bin 1 could hold the package, but the search only visits bins 2 and 3,
  // both full, and moves right past it.
  BinRegistry registry;
  registry.Load({{1, 10, "F1", 0}, {2, 20, "F2", 20}, {3, 30, "F3", 30}});

  assert(!registry.FindBestFit(Pkg("PKG_F", 5)).has_value());
}

void TestResultAlwaysHoldsThePackage() {
  BinRegistry registry;
  registry.Load({{1, 40, "G1", 35}, {2, 60, "G2", 10}, {3, 60, "G3", 59}, {4, 80, "G4", 0}, {5, 120, "G5", 100}, {6, 300, "G6", 1}});

  for (std::int64_t size = 1; size <= 320; ++size) {
    auto bin = registry.FindBestFit(Pkg("PKG_G", size));
    if (bin) {
      assert(bin->Capacity() >= size);
      assert(bin->AvailableSpace() >= size);
    }
  }
}

void TestSmallestBinWhenAllEmpty() {
  BinRegistry registry;
  registry.Load({{1, 70, "H1"}, {2, 10, "H2"}, {3, 500, "H3"}, {4, 35, "H4"}, {5, 120, "H5"}});

  const std::vector<std::int64_t> capacities = {10, 35, 70, 120, 500};
  for (std::int64_t size = 1; size <= 500; ++size) {
    std::int64_t expected = 0;
    for (auto cap : capacities) {
      if (cap >= size) {
        expected = cap;
        break;
      }
    }
    auto bin = registry.FindBestFit(Pkg("PKG_H", size));
    assert(bin && bin->Capacity() == expected);
  }
}

void TestOccupyKeepsOrderAndBounds() {
  BinRegistry registry;
  registry.Load(DockInventory());

  const auto before = registry.Snapshot();
  assert(registry.Occupy(5, 400));
  assert(registry.Occupy(1, 50));

  auto overflow = registry.Occupy(1, 1);
  assert(overflow.code == ErrorCode::CapacityExceeded);
  assert(registry.Get(1)->UsedSpace() == 50);

  const auto after = registry.Snapshot();
  assert(after.size() == before.size());
  for (std::size_t i = 0; i < after.size(); ++i) {
    assert(after[i].BinId() == before[i].BinId());
    assert(after[i].UsedSpace() >= 0 && after[i].UsedSpace() <= after[i].Capacity());
  }
}

void TestOccupyReportsUsageAfterUpdate() {
  BinRegistry registry;
  registry.Load(DockInventory());

  std::int64_t used = -1;
  assert(registry.Occupy(2, 30, &used));
  assert(used == 30);
  assert(registry.Occupy(2, 45, &used));
  assert(used == 75);

  // A rejected occupy leaves the out value alone.
  assert(registry.Occupy(2, 26, &used).code == ErrorCode::CapacityExceeded);
  assert(used == 75);
}

void TestOccupyUnknownBin() {
  BinRegistry registry;
  registry.Load(DockInventory());

  assert(registry.Occupy(42, 1).code == ErrorCode::UnknownBin);
  assert(!registry.Get(42).has_value());
}

void TestLoadDropsInvalidAndDuplicateBins() {
  BinRegistry registry;
  auto        kept = registry.Load({{1, 50, "A1"}, {1, 900, "DUP"}, {2, 0, "ZERO"}, {3, 10, "OVER", 11}, {4, 20, "OK"}});

  assert(kept == 2);
  assert(registry.Size() == 2);
  assert(registry.Get(1)->Capacity() == 50);
  assert(!registry.Get(2).has_value());
  assert(!registry.Get(3).has_value());

  // Ordered by capacity.
  auto snapshot = registry.Snapshot();
  assert(snapshot[0].BinId() == 4);
  assert(snapshot[1].BinId() == 1);
}

void TestReloadReplacesInventory() {
  BinRegistry registry;
  registry.Load(DockInventory());
  registry.Load({{9, 75, "Z9", 5}});

  assert(registry.Size() == 1);
  assert(!registry.Get(1).has_value());
  assert(registry.Get(9)->UsedSpace() == 5);
}

} // namespace

int main() {
  TestShiftAllocation();
  TestOversizedPackageHasNoBin();
  TestEqualCapacityPicksTheBinWithRoom();
  TestEqualCapacityTieSettlesLeftOfFirstMidpoint();
  TestNarrowingSkipsBinBehindFullerMidpoint();
  TestResultAlwaysHoldsThePackage();
  TestSmallestBinWhenAllEmpty();
  TestOccupyKeepsOrderAndBounds();
  TestOccupyReportsUsageAfterUpdate();
  TestOccupyUnknownBin();
  TestLoadDropsInvalidAndDuplicateBins();
  TestReloadReplacesInventory();

  std::cout << "warehouse_unit_bin_registry: pass\n";
  return 0;
}
