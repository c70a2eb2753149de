#pragma once

#include "core/BasicTypes.hpp"
#include "core/concepts/GameConcept.hpp"
#include "minimax/Scorer.hpp"
#include "minimax/SearchNode.hpp"
#include "minimax/TranspositionTable.hpp"

#include <memory>
#include <vector>

namespace minimax {

/*
 * SearchTree owns the transposition table of one game session together with the key of the
 * current node, i.e., the node of the live game position, which is always resident.
 *
 * All expansion goes through expand_node(), which routes every produced successor through
 * TranspositionTable::add_or_merge() and then rescores the parent. Score changes are propagated
 * to predecessors until a fixed point is reached.
 */
template <core::concepts::Game Game>
class SearchTree {
 public:
  using State = Game::State;
  using Move = Game::Move;
  using Node = SearchNode<Game>;
  using Table = TranspositionTable<Game>;
  using Scorer = minimax::Scorer<Game>;
  using key_vec_t = std::vector<core::node_key_t>;
  using node_cptr_vec_t = std::vector<const Node*>;

  explicit SearchTree(const State& state,
                      std::unique_ptr<Scorer> scorer = std::make_unique<MinimaxScorer<Game>>());

  // Discards the whole table and restarts from state.
  void reset(const State& state);

  Node& current_node() { return table_.at(current_key_); }
  const Node& current_node() const { return table_.at(current_key_); }
  const core::node_key_t& current_key() const { return current_key_; }

  Table& table() { return table_; }
  const Table& table() const { return table_; }
  size_t size() const { return table_.size(); }

  /*
   * Expands node, which must be resident and unexpanded, registers its successors in the table,
   * and rescores. Returns true iff the node had at least one successor.
   */
  bool expand_node(Node& node);

  bool has_unexpanded_nodes() const;

  // Keys of all resident unexpanded nodes, in sorted order.
  key_vec_t unexpanded_keys() const;

  // Resident successors of node, in successor order.
  node_cptr_vec_t successor_nodes(const Node& node) const;

  /*
   * Moves the current node along the edge labeled move.
   *
   * Throws core::InvalidStateError if the current node is not expanded, and core::IllegalMoveError
   * if move is not one of its successors.
   */
  void advance(const Move& move);

 private:
  // Rescores node, and if its score changed, every transitive predecessor whose score changes.
  void rescore_and_propagate(Node& node);

  std::unique_ptr<Scorer> scorer_;
  Table table_;
  core::node_key_t current_key_;
};

}  // namespace minimax

#include "inline/minimax/SearchTree.inl"
