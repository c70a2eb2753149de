#pragma once

#include "core/BasicTypes.hpp"
#include "core/concepts/GameConcept.hpp"
#include "minimax/ExpansionControl.hpp"
#include "minimax/MoveSelector.hpp"
#include "minimax/PruningPolicy.hpp"
#include "minimax/Scorer.hpp"
#include "minimax/SearchTree.hpp"

#include <cstddef>
#include <memory>
#include <optional>

namespace minimax {

/*
 * Driver plays one game session with a minimax search tree.
 *
 * A decision cycle is:
 *
 * 1. choose_move(): expand the tree under the expansion control, then select a move at the
 *    (already scored) current node.
 * 2. make_move(): commit the move, advancing the current node, then prune.
 *
 * play() repeats this until the game is finished.
 *
 * The Driver owns its SearchTree and every policy object. It does not catch exceptions thrown
 * by the Game or by the policies.
 */
template <core::concepts::Game Game>
class Driver {
 public:
  using State = Game::State;
  using Move = Game::Move;
  using Rules = Game::Rules;
  using MoveVector = Game::Types::MoveVector;
  using ValueArray = Game::Types::ValueArray;

  using SearchTree = minimax::SearchTree<Game>;
  using ExpansionControl = minimax::ExpansionControl<Game>;
  using MoveSelector = minimax::MoveSelector<Game>;
  using PruningPolicy = minimax::PruningPolicy<Game>;
  using Scorer = minimax::Scorer<Game>;

  Driver(std::unique_ptr<ExpansionControl> expansion, std::unique_ptr<MoveSelector> selector,
         std::unique_ptr<PruningPolicy> pruning,
         std::unique_ptr<Scorer> scorer = std::make_unique<MinimaxScorer<Game>>(),
         bool debug = false);

  // Discards the tree and restarts the session from state.
  void reset(const State& state) { tree_.reset(state); }

  /*
   * Runs one expansion cycle and returns the selected move.
   *
   * Throws core::InvalidStateError if the game is finished.
   */
  Move choose_move();

  /*
   * Commits move: expands the current node if needed, advances, and prunes.
   *
   * Throws core::IllegalMoveError if move is not legal in the current state, in which case the
   * tree and the current node are left unchanged.
   */
  void make_move(const Move& move);

  // Plays against itself until the game is finished.
  void play();

  const State& current_state() const { return tree_.current_node().state(); }
  std::optional<core::seat_index_t> active_player() const;
  bool is_finished() const;
  MoveVector all_legal_moves() const;
  std::optional<core::seat_index_t> winner() const;

  size_t num_states() const { return tree_.size(); }
  const std::optional<ValueArray>& current_score() const { return tree_.current_node().score(); }

  const SearchTree& tree() const { return tree_; }
  bool debug() const { return debug_; }

 private:
  void report() const;

  std::unique_ptr<ExpansionControl> expansion_;
  std::unique_ptr<MoveSelector> selector_;
  std::unique_ptr<PruningPolicy> pruning_;
  SearchTree tree_;
  const bool debug_;
};

}  // namespace minimax

#include "inline/minimax/Driver.inl"
