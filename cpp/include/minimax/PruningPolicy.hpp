#pragma once

#include "core/concepts/GameConcept.hpp"
#include "minimax/SearchTree.hpp"

#include <cstddef>

namespace minimax {

/*
 * Invoked by the Driver after every committed move, once the current node has advanced.
 */
template <core::concepts::Game Game>
class PruningPolicy {
 public:
  using SearchTree = minimax::SearchTree<Game>;

  virtual ~PruningPolicy() = default;

  // Returns the number of nodes removed from the table.
  virtual size_t prune(SearchTree& tree) = 0;
};

template <core::concepts::Game Game>
class NoPruning : public PruningPolicy<Game> {
 public:
  using SearchTree = PruningPolicy<Game>::SearchTree;

  size_t prune(SearchTree&) override { return 0; }
};

/*
 * Keeps exactly the nodes reachable from the current node via successor edges, and erases all
 * others from the table. Information about positions that are no longer reachable is lost, and is
 * recomputed if such a position is reached again by transposition.
 */
template <core::concepts::Game Game>
class ReachabilityPruning : public PruningPolicy<Game> {
 public:
  using SearchTree = PruningPolicy<Game>::SearchTree;
  using Table = SearchTree::Table;
  using key_set_t = Table::key_set_t;

  // If debug is set, each prune() reports the table size arithmetic.
  explicit ReachabilityPruning(bool debug = false) : debug_(debug) {}

  size_t prune(SearchTree& tree) override;

  static key_set_t reachable_keys(const SearchTree& tree);

 private:
  const bool debug_;
};

}  // namespace minimax

#include "inline/minimax/PruningPolicy.inl"
