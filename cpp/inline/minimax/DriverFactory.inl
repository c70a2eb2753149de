#include "minimax/DriverFactory.hpp"

#include "minimax/BoundedExpansion.hpp"
#include "minimax/ExpansionStrategies.hpp"
#include "minimax/ForwardSweepExpansion.hpp"
#include "minimax/FullExpansion.hpp"
#include "minimax/Scorer.hpp"
#include "util/Exception.hpp"

namespace minimax {

template <core::concepts::Game Game>
std::unique_ptr<typename DriverFactory<Game>::Driver> DriverFactory<Game>::create(
    const Params& params) {
  params.validate();
  return std::make_unique<Driver>(create_expansion(params), create_move_selector(params),
                                  create_pruning(params), std::make_unique<MinimaxScorer<Game>>(),
                                  params.debug);
}

template <core::concepts::Game Game>
std::unique_ptr<typename DriverFactory<Game>::ExpansionControl>
DriverFactory<Game>::create_expansion(const Params& params) {
  std::unique_ptr<ExpansionControl> control;
  if (params.expansion == "current") {
    control = std::make_unique<CurrentNodeExpansion<Game>>();
  } else if (params.expansion == "one-step") {
    control = std::make_unique<OneStepExpansion<Game>>();
  } else if (params.expansion == "sweep") {
    control = std::make_unique<ForwardSweepExpansion<Game>>(params.search_depth, params.debug);
  } else {
    throw util::CleanException("Unknown expansion strategy: {}", params.expansion);
  }

  if (params.time_limit > 0 || params.node_limit > 0) {
    control = std::make_unique<BoundedExpansion<Game>>(std::move(control), params.time_limit,
                                                       params.node_limit);
  }
  if (params.full_expansion) {
    control = std::make_unique<FullExpansion<Game>>(std::move(control));
  }
  return control;
}

template <core::concepts::Game Game>
std::unique_ptr<typename DriverFactory<Game>::MoveSelector>
DriverFactory<Game>::create_move_selector(const Params& params) {
  if (params.move_selector == "first") {
    return std::make_unique<FirstMoveSelector<Game>>();
  } else if (params.move_selector == "random") {
    return std::make_unique<UniformRandomMoveSelector<Game>>();
  } else if (params.move_selector == "random-best") {
    return std::make_unique<RandomBestMoveSelector<Game>>();
  }
  throw util::CleanException("Unknown move selector: {}", params.move_selector);
}

template <core::concepts::Game Game>
std::unique_ptr<typename DriverFactory<Game>::PruningPolicy> DriverFactory<Game>::create_pruning(
    const Params& params) {
  if (params.pruning) {
    return std::make_unique<ReachabilityPruning<Game>>(params.debug);
  }
  return std::make_unique<NoPruning<Game>>();
}

}  // namespace minimax
