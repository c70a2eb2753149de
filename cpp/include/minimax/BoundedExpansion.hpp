#pragma once

#include "core/concepts/GameConcept.hpp"
#include "minimax/ExpansionControl.hpp"

#include <chrono>
#include <cstddef>
#include <memory>

namespace minimax {

/*
 * Wraps another control with a wall-clock budget (time_limit, in seconds) and a table-size budget
 * (node_limit). A limit of 0 means unlimited.
 *
 * Budgets are only checked after each inner step: step() returns false once the inner step did no
 * work, or once elapsed time since begin_cycle() reached time_limit, or once the table holds at
 * least node_limit nodes. A single inner step may therefore overshoot either budget.
 *
 * expand() steps until step() returns false.
 */
template <core::concepts::Game Game>
class BoundedExpansion : public ExpansionControl<Game> {
 public:
  using base_t = ExpansionControl<Game>;
  using SearchTree = base_t::SearchTree;
  using clock_t = std::chrono::steady_clock;

  BoundedExpansion(std::unique_ptr<base_t> inner, double time_limit, size_t node_limit);

  void begin_cycle(SearchTree& tree) override;
  bool step(SearchTree& tree) override;
  void expand(SearchTree& tree) override;
  void end_cycle(SearchTree& tree) override { inner_->end_cycle(tree); }

  bool limit_exceeded(const SearchTree& tree) const;

 private:
  std::unique_ptr<base_t> inner_;
  const double time_limit_;
  const size_t node_limit_;
  clock_t::time_point start_time_;
};

}  // namespace minimax

#include "inline/minimax/BoundedExpansion.inl"
