#include "games/tictactoe/Game.hpp"

#include "core/Exceptions.hpp"

#include <bit>

namespace tictactoe {

inline mask_t Game::State::x_mask() const {
  return std::popcount(full_mask) % 2 == kX ? cur_player_mask : opponent_mask();
}

inline mask_t Game::State::o_mask() const {
  return std::popcount(full_mask) % 2 == kO ? cur_player_mask : opponent_mask();
}

inline core::seat_index_t Game::State::get_player_at(int row, int col) const {
  mask_t bit = mask_t(1) << (row * kBoardDimension + col);
  if (x_mask() & bit) return kX;
  if (o_mask() & bit) return kO;
  return -1;
}

inline Game::Move Game::cell_index(int row, int col) {
  if (row < 0 || row >= kBoardDimension || col < 0 || col >= kBoardDimension) {
    throw core::IllegalMoveError("Cell ({}, {}) is off the board", row, col);
  }
  return row * kBoardDimension + col;
}

inline Game::State Game::Rules::starting_state() {
  State state;
  state.full_mask = 0;
  state.cur_player_mask = 0;
  return state;
}

inline bool Game::Rules::is_winner(const State& state, core::seat_index_t seat) {
  mask_t player_mask = (seat == kX) ? state.x_mask() : state.o_mask();
  for (mask_t mask : kThreeInARowMasks) {
    if ((mask & player_mask) == mask) return true;
  }
  return false;
}

inline bool Game::Rules::is_finished(const State& state) {
  return state.full_mask == kFullBoardMask || is_winner(state, kX) || is_winner(state, kO);
}

inline std::optional<core::seat_index_t> Game::Rules::active_player(const State& state) {
  if (is_finished(state)) return std::nullopt;
  return core::seat_index_t(std::popcount(state.full_mask) % 2);
}

inline bool Game::Rules::is_legal_move(const State& state, Move move) {
  if (move < 0 || move >= kNumCells) return false;
  if (state.full_mask & (mask_t(1) << move)) return false;
  return !is_finished(state);
}

inline std::optional<core::seat_index_t> Game::Rules::winner(const State& state) {
  if (is_winner(state, kX)) return kX;
  if (is_winner(state, kO)) return kO;
  if (!is_finished(state)) {
    throw core::InvalidStateError("winner() called on an unfinished game:\n{}",
                                  IO::state_repr(state));
  }
  return std::nullopt;
}

inline std::optional<Game::Types::ValueArray> Game::Rules::evaluate(const State& state) {
  if (!is_finished(state)) return std::nullopt;

  std::optional<core::seat_index_t> w = winner(state);
  if (w) return GameResults::win(*w);
  return GameResults::draw();
}

inline core::node_key_t Game::Keys::node_key(const State& state) {
  const char* syms = "_XO";

  core::node_key_t key(kNumCells, '_');
  for (int row = 0; row < kBoardDimension; ++row) {
    for (int col = 0; col < kBoardDimension; ++col) {
      key[row * kBoardDimension + col] = syms[state.get_player_at(row, col) + 1];
    }
  }
  return key;
}

}  // namespace tictactoe
