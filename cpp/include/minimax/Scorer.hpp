#pragma once

#include "core/concepts/GameConcept.hpp"
#include "minimax/SearchNode.hpp"
#include "minimax/TranspositionTable.hpp"

namespace minimax {

/*
 * A Scorer recomputes the score (and best-move cache) of one node from the current scores of its
 * successors in the table. SearchTree calls rescore() after every expansion and merge, and walks
 * the predecessor relation while scores keep changing.
 */
template <core::concepts::Game Game>
class Scorer {
 public:
  using Node = SearchNode<Game>;
  using Table = TranspositionTable<Game>;

  virtual ~Scorer() = default;

  // Returns true iff node's score changed.
  virtual bool rescore(Node& node, const Table& table) const = 0;
};

/*
 * Minimax backward propagation.
 *
 * - A terminal node keeps the Game's evaluation of its state.
 * - An unexpanded non-terminal node has no score.
 * - An expanded non-terminal node takes the value of the successor that maximizes the active
 *   player's entry. Since the whole value array is copied, the opponent's entry follows
 *   symmetrically in zero-sum games. A successor without a score ranks as neutral_value(), so an
 *   unexplored move is preferred to a known loss and a known win is preferred to it. If no
 *   successor has a score yet, neither does the node.
 *
 * Ties are all kept in the best-move cache, in successor order.
 */
template <core::concepts::Game Game>
class MinimaxScorer : public Scorer<Game> {
 public:
  using Node = Scorer<Game>::Node;
  using Table = Scorer<Game>::Table;
  using ValueArray = Node::ValueArray;

  bool rescore(Node& node, const Table& table) const override;

  // Value of a game whose outcome is not known yet: 0 for every seat.
  static ValueArray neutral_value() { return ValueArray::Zero(); }
};

}  // namespace minimax

#include "inline/minimax/Scorer.inl"
