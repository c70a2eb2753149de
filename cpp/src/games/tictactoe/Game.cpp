#include "games/tictactoe/Game.hpp"

#include "core/Exceptions.hpp"

#include <spdlog/fmt/fmt.h>

#include <bit>

namespace tictactoe {

Game::Types::MoveVector Game::Rules::all_legal_moves(const State& state) {
  Types::MoveVector moves;
  if (is_finished(state)) return moves;

  uint32_t u = kFullBoardMask & ~state.full_mask;
  while (u) {
    moves.push_back(std::countr_zero(u));
    u &= u - 1;
  }
  return moves;
}

Game::State Game::Rules::make_move(const State& state, Move move) {
  if (!is_legal_move(state, move)) {
    throw core::IllegalMoveError("Illegal move {} in state:\n{}", IO::move_to_str(move),
                                 IO::state_repr(state));
  }

  State successor = state;
  mask_t piece_mask = mask_t(1) << move;
  successor.cur_player_mask ^= successor.full_mask;
  successor.full_mask |= piece_mask;
  return successor;
}

void Game::IO::print_state(std::ostream& ss, const State& state) {
  mask_t o_mask = state.o_mask();
  mask_t x_mask = state.x_mask();

  char text[] =
      "0 1 2  | | | |\n"
      "3 4 5  | | | |\n"
      "6 7 8  | | | |\n";

  int offset_table[] = {8, 10, 12, 23, 25, 27, 38, 40, 42};
  for (int i = 0; i < kNumCells; ++i) {
    int offset = offset_table[i];
    if (o_mask & (mask_t(1) << i)) {
      text[offset] = 'O';
    } else if (x_mask & (mask_t(1) << i)) {
      text[offset] = 'X';
    }
  }

  ss << text;
}

std::string Game::IO::state_repr(const State& state) {
  std::string repr;
  const char* syms = " XO";
  for (int row = 0; row < kBoardDimension; ++row) {
    if (row) repr += "---+---+---\n";
    repr += fmt::format(" {} | {} | {}\n", syms[state.get_player_at(row, 0) + 1],
                        syms[state.get_player_at(row, 1) + 1],
                        syms[state.get_player_at(row, 2) + 1]);
  }

  std::optional<core::seat_index_t> cp = Rules::active_player(state);
  if (cp) {
    repr += fmt::format("Move: {}", player_to_str(*cp));
  } else {
    std::optional<core::seat_index_t> w = Rules::winner(state);
    repr += fmt::format("Winner: {}", w ? player_to_str(*w) : "none");
  }
  return repr;
}

}  // namespace tictactoe
