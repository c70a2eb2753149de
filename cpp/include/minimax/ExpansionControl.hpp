#pragma once

#include "core/concepts/GameConcept.hpp"
#include "minimax/SearchTree.hpp"

namespace minimax {

/*
 * Base class for everything that grows a SearchTree during a decision cycle.
 *
 * A decision cycle runs:
 *
 * control.begin_cycle(tree);
 * control.expand(tree);
 * control.end_cycle(tree);
 *
 * step() performs one unit of work and returns whether another step may be run. expand() runs the
 * cycle's expansion; by default that is a single step. Budget exhaustion is reported through the
 * return value of step(), never through an exception.
 *
 * Controls that wrap another control (FullExpansion, BoundedExpansion) call the wrapped control's
 * step(), not its expand(), and forward begin_cycle()/end_cycle(). The order of wrapping matters:
 * BoundedExpansion(FullExpansion(x)) never observes a budget, because FullExpansion only returns
 * from its step() at its own fixed point, whereas FullExpansion(BoundedExpansion(x)) stops as soon
 * as the budget is exceeded.
 */
template <core::concepts::Game Game>
class ExpansionControl {
 public:
  using SearchTree = minimax::SearchTree<Game>;

  virtual ~ExpansionControl() = default;

  virtual void begin_cycle(SearchTree&) {}
  virtual bool step(SearchTree& tree) = 0;
  virtual void expand(SearchTree& tree) { step(tree); }
  virtual void end_cycle(SearchTree&) {}
};

/*
 * An ExpansionStrategy decides which unexpanded node(s) to expand in one step. Its step() returns
 * whether any expansion happened.
 */
template <core::concepts::Game Game>
class ExpansionStrategy : public ExpansionControl<Game> {};

}  // namespace minimax
