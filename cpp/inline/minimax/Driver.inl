#include "minimax/Driver.hpp"

#include "core/Exceptions.hpp"
#include "util/LoggingUtil.hpp"

#include <algorithm>

namespace minimax {

template <core::concepts::Game Game>
Driver<Game>::Driver(std::unique_ptr<ExpansionControl> expansion,
                     std::unique_ptr<MoveSelector> selector,
                     std::unique_ptr<PruningPolicy> pruning, std::unique_ptr<Scorer> scorer,
                     bool debug)
    : expansion_(std::move(expansion)),
      selector_(std::move(selector)),
      pruning_(std::move(pruning)),
      tree_(Rules::starting_state(), std::move(scorer)),
      debug_(debug) {}

template <core::concepts::Game Game>
typename Driver<Game>::Move Driver<Game>::choose_move() {
  if (is_finished()) {
    throw core::InvalidStateError("choose_move() called on a finished game:\n{}",
                                  Game::IO::state_repr(current_state()));
  }

  expansion_->begin_cycle(tree_);
  expansion_->expand(tree_);
  expansion_->end_cycle(tree_);

  std::optional<Move> move = selector_->select(tree_.current_node());
  if (!move) {
    throw core::InvalidStateError("No legal move found in state:\n{}",
                                  Game::IO::state_repr(current_state()));
  }
  return *move;
}

template <core::concepts::Game Game>
void Driver<Game>::make_move(const Move& move) {
  MoveVector legal_moves = all_legal_moves();
  if (std::find(legal_moves.begin(), legal_moves.end(), move) == legal_moves.end()) {
    throw core::IllegalMoveError("Illegal move {} in state:\n{}", Game::IO::move_to_str(move),
                                 Game::IO::state_repr(current_state()));
  }

  auto& node = tree_.current_node();
  if (!node.is_expanded()) {
    tree_.expand_node(node);
  }
  tree_.advance(move);
  pruning_->prune(tree_);
}

template <core::concepts::Game Game>
void Driver<Game>::play() {
  if (debug_) report();
  while (!is_finished()) {
    Move move = choose_move();
    if (debug_) {
      core::seat_index_t player = *active_player();
      LOG_INFO("{} plays {}", Game::IO::player_to_str(player), Game::IO::move_to_str(move));
    }
    make_move(move);
    if (debug_) report();
  }
}

template <core::concepts::Game Game>
std::optional<core::seat_index_t> Driver<Game>::active_player() const {
  return Rules::active_player(current_state());
}

template <core::concepts::Game Game>
bool Driver<Game>::is_finished() const {
  return Rules::is_finished(current_state());
}

template <core::concepts::Game Game>
typename Driver<Game>::MoveVector Driver<Game>::all_legal_moves() const {
  return Rules::all_legal_moves(current_state());
}

template <core::concepts::Game Game>
std::optional<core::seat_index_t> Driver<Game>::winner() const {
  return Rules::winner(current_state());
}

template <core::concepts::Game Game>
void Driver<Game>::report() const {
  LOG_INFO("\n{}", Game::IO::state_repr(current_state()));
  LOG_INFO("Nodes in the search tree: {}", num_states());
}

}  // namespace minimax
