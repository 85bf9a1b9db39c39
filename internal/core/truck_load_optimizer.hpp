#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "internal/model/package.hpp"

namespace warehouse::core {

struct OptimizerOptions {
  // Upper bound on visited search nodes. 0 = unbounded.
  std::uint64_t max_explored_nodes = 0;

  // Only the first N candidates are considered. 0 = unbounded.
  std::size_t max_candidates = 0;
};

struct LoadPlan {
  std::vector<model::Package> packages; // input order preserved
  std::int64_t                total_size     = 0;
  std::uint64_t               explored_nodes = 0;

  // A limit from OptimizerOptions cut the search short; the plan is the
  // best found before that point and may not be optimal.
  bool truncated = false;
};

/*
  Picks the subset of candidates that fills the truck as close to
  max_capacity as possible without exceeding it.

  Exhaustive depth-first include/exclude search in input order, include
  branch first. Inclusion is pruned when it would overflow the truck;
  nothing else is pruned, so cost is O(2^n) in the worst case and callers
  should keep candidate lists short or set OptimizerOptions limits.

  Ties in total size go to the first subset the traversal reaches.
*/
class TruckLoadOptimizer {
 public:
  explicit TruckLoadOptimizer(OptimizerOptions options = {});

  LoadPlan Optimize(const std::vector<model::Package>& packages, std::int64_t max_capacity) const;

  const OptimizerOptions& Options() const {
    return options_;
  }

 private:
  struct SearchState {
    const std::vector<model::Package>& packages;
    std::size_t                        candidate_count = 0;
    std::int64_t                       max_capacity    = 0;

    std::vector<std::size_t> current; // indices into packages
    std::vector<std::size_t> best;
    std::int64_t             best_total = 0;
    std::uint64_t            explored   = 0;
    bool                     truncated  = false;
  };

  void Search(SearchState& state, std::size_t index, std::int64_t current_total) const;

  OptimizerOptions options_;
};

} // namespace warehouse::core
