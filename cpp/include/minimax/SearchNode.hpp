#pragma once

#include "core/BasicTypes.hpp"
#include "core/concepts/GameConcept.hpp"

#include <optional>
#include <set>
#include <utility>
#include <vector>

namespace minimax {

/*
 * A SearchNode wraps one game state. Its identity is Game::Keys::node_key() of that state.
 *
 * Nodes never point at each other. Both the successor relation (move -> key) and the predecessor
 * relation (set of keys) are expressed in terms of node keys, which are resolved through the
 * TranspositionTable that owns all resident nodes.
 *
 * The expanded flag is monotonic: it goes from false to true exactly once, either via expand() or
 * via merge() with an expanded copy of the same state.
 *
 * The score is maintained by a Scorer (see Scorer.hpp). A terminal node's score is fixed at
 * construction from Game::Rules::evaluate(). An unexpanded non-terminal node has no score.
 */
template <core::concepts::Game Game>
class SearchNode {
 public:
  using State = Game::State;
  using Move = Game::Move;
  using Rules = Game::Rules;
  using ValueArray = Game::Types::ValueArray;

  using successor_t = std::pair<Move, core::node_key_t>;
  using successor_vec_t = std::vector<successor_t>;
  using key_set_t = std::set<core::node_key_t>;
  using move_vec_t = std::vector<Move>;
  using expansion_vec_t = std::vector<std::pair<Move, SearchNode>>;

  explicit SearchNode(const State& state);

  const core::node_key_t& node_key() const { return key_; }
  const State& state() const { return state_; }
  std::optional<core::seat_index_t> active_player() const { return active_player_; }
  bool is_terminal() const { return !active_player_.has_value(); }
  bool is_expanded() const { return expanded_; }

  /*
   * Enumerates all legal moves of the wrapped state and returns one freshly constructed successor
   * node per move, in Game::Rules::all_legal_moves() order. The returned nodes are not resident in
   * any table, and each lists this node's key as its sole predecessor.
   *
   * Afterwards, is_expanded() is true and successors() is populated.
   *
   * Throws core::InvalidStateError if the node is already expanded.
   */
  expansion_vec_t expand();

  /*
   * Folds other, a node for the same state reached via a different path, into this one: the
   * successor and predecessor relations become unions, and the expanded flag is or'ed.
   *
   * Returns true iff this node changed. Merging with an identical copy is a no-op that returns
   * false.
   *
   * The score is not touched here. The caller (SearchTree) rescores after merging, since
   * computing a score requires the table.
   *
   * Throws core::InvalidStateError if the keys differ.
   */
  bool merge(const SearchNode& other);

  const successor_vec_t& successors() const { return successors_; }
  std::optional<core::node_key_t> successor_key(const Move& move) const;

  const key_set_t& predecessors() const { return predecessors_; }
  void add_predecessor(const core::node_key_t& key) { predecessors_.insert(key); }

  // Removes every predecessor key for which pred(key) is true. Returns the number removed.
  template <typename Pred>
  int remove_predecessors_if(Pred pred);

  bool has_score() const { return score_.has_value(); }
  const std::optional<ValueArray>& score() const { return score_; }
  std::optional<float> score(core::seat_index_t player) const;

  // Moves attaining score(), in successors() order. Empty if there is no score or no successor.
  const move_vec_t& best_moves() const { return best_moves_; }
  std::optional<Move> best_move() const;

  // Returns true iff the score changed. The best-move cache is always replaced.
  bool set_score(const std::optional<ValueArray>& score, const move_vec_t& best_moves);

 private:
  static bool same_score(const std::optional<ValueArray>& a, const std::optional<ValueArray>& b);

  State state_;
  core::node_key_t key_;
  std::optional<core::seat_index_t> active_player_;
  bool expanded_ = false;

  successor_vec_t successors_;
  key_set_t predecessors_;

  std::optional<ValueArray> score_;
  move_vec_t best_moves_;
};

}  // namespace minimax

#include "inline/minimax/SearchNode.inl"
