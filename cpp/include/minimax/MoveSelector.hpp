#pragma once

#include "core/concepts/GameConcept.hpp"
#include "minimax/SearchNode.hpp"

#include <optional>

namespace minimax {

/*
 * Picks a move at a node of a scored tree. Returns std::nullopt only if the node's state has no
 * legal moves.
 *
 * The candidates of the score-aware selectors are the node's best moves. If no successor has a
 * score yet, all legal moves of the state are candidates.
 */
template <core::concepts::Game Game>
class MoveSelector {
 public:
  using Node = SearchNode<Game>;
  using Move = Game::Move;
  using move_vec_t = Node::move_vec_t;

  virtual ~MoveSelector() = default;

  virtual std::optional<Move> select(const Node& node) = 0;

 protected:
  static move_vec_t candidates(const Node& node);
};

// Lowest-ordered move (by operator<) among the candidates.
template <core::concepts::Game Game>
class FirstMoveSelector : public MoveSelector<Game> {
 public:
  using Node = MoveSelector<Game>::Node;
  using Move = MoveSelector<Game>::Move;

  std::optional<Move> select(const Node& node) override;
};

// Any legal move, uniformly at random. Ignores scores.
template <core::concepts::Game Game>
class UniformRandomMoveSelector : public MoveSelector<Game> {
 public:
  using Node = MoveSelector<Game>::Node;
  using Move = MoveSelector<Game>::Move;

  std::optional<Move> select(const Node& node) override;
};

// Uniformly at random among the candidates.
template <core::concepts::Game Game>
class RandomBestMoveSelector : public MoveSelector<Game> {
 public:
  using Node = MoveSelector<Game>::Node;
  using Move = MoveSelector<Game>::Move;

  std::optional<Move> select(const Node& node) override;
};

}  // namespace minimax

#include "inline/minimax/MoveSelector.inl"
