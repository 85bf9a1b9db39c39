#include "truck_load_optimizer.hpp"

#include "internal/observability/logging.hpp"

namespace warehouse::core {

TruckLoadOptimizer::TruckLoadOptimizer(OptimizerOptions options) : options_(options) {
}

LoadPlan TruckLoadOptimizer::Optimize(const std::vector<model::Package>& packages, std::int64_t max_capacity) const {
  LoadPlan plan;
  if (max_capacity <= 0 || packages.empty()) {
    return plan;
  }

  SearchState state{packages};
  state.max_capacity    = max_capacity;
  state.candidate_count = packages.size();
  if (options_.max_candidates > 0 && packages.size() > options_.max_candidates) {
    WAREHOUSE_LOG_WARN("Truck candidate list exceeds limit, tail ignored",
                       {observability::IntField("candidates", static_cast<std::int64_t>(packages.size())),
                        observability::IntField("max_candidates", static_cast<std::int64_t>(options_.max_candidates))});
    state.candidate_count = options_.max_candidates;
    state.truncated       = true;
  }
  state.current.reserve(state.candidate_count);

  Search(state, 0, 0);

  plan.packages.reserve(state.best.size());
  for (auto index : state.best) {
    plan.packages.push_back(packages[index]);
  }
  plan.total_size     = state.best_total;
  plan.explored_nodes = state.explored;
  plan.truncated      = state.truncated;
  return plan;
}

void TruckLoadOptimizer::Search(SearchState& state, std::size_t index, std::int64_t current_total) const {
  if (options_.max_explored_nodes > 0 && state.explored >= options_.max_explored_nodes) {
    state.truncated = true;
    return;
  }
  ++state.explored;

  if (current_total > state.best_total) {
    state.best_total = current_total;
    state.best       = state.current;
  }

  if (index == state.candidate_count) {
    return;
  }

  const auto& pkg = state.packages[index];

  // take it, if it fits
  if (pkg.size > 0 && current_total + pkg.size <= state.max_capacity) {
    state.current.push_back(index);
    Search(state, index + 1, current_total + pkg.size);
    state.current.pop_back();
  }

  // skip it
  Search(state, index + 1, current_total);
}

} // namespace warehouse::core
