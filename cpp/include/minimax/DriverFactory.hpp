#pragma once

#include "core/concepts/GameConcept.hpp"
#include "minimax/Driver.hpp"
#include "minimax/Params.hpp"

#include <memory>

namespace minimax {

/*
 * Builds a Driver from Params.
 *
 * The expansion chain is built inside-out:
 *
 * 1. The strategy: CurrentNodeExpansion, OneStepExpansion, or ForwardSweepExpansion.
 * 2. Wrapped in BoundedExpansion if time_limit or node_limit is non-zero.
 * 3. Wrapped in FullExpansion if full_expansion is set.
 *
 * Scoring is always MinimaxScorer. Pruning is ReachabilityPruning unless disabled.
 */
template <core::concepts::Game Game>
class DriverFactory {
 public:
  using Driver = minimax::Driver<Game>;
  using ExpansionControl = Driver::ExpansionControl;
  using MoveSelector = Driver::MoveSelector;
  using PruningPolicy = Driver::PruningPolicy;

  // Validates params, then builds each part. Throws util::CleanException on invalid params.
  static std::unique_ptr<Driver> create(const Params& params);

  // The parts. These expect params that already passed Params::validate().
  static std::unique_ptr<ExpansionControl> create_expansion(const Params& params);
  static std::unique_ptr<MoveSelector> create_move_selector(const Params& params);
  static std::unique_ptr<PruningPolicy> create_pruning(const Params& params);
};

}  // namespace minimax

#include "inline/minimax/DriverFactory.inl"
