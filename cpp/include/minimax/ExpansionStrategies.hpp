#pragma once

#include "core/concepts/GameConcept.hpp"
#include "minimax/ExpansionControl.hpp"

namespace minimax {

/*
 * Expands only the current node, if it is not expanded yet.
 */
template <core::concepts::Game Game>
class CurrentNodeExpansion : public ExpansionStrategy<Game> {
 public:
  using SearchTree = ExpansionStrategy<Game>::SearchTree;

  bool step(SearchTree& tree) override;
};

/*
 * Expands every node that is unexpanded at the start of the step, exactly once. This is not
 * recursive: successors produced during the step are left for the next step.
 */
template <core::concepts::Game Game>
class OneStepExpansion : public ExpansionStrategy<Game> {
 public:
  using SearchTree = ExpansionStrategy<Game>::SearchTree;

  bool step(SearchTree& tree) override;
};

}  // namespace minimax

#include "inline/minimax/ExpansionStrategies.inl"
