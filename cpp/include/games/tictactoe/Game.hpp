#pragma once

#include "core/BasicTypes.hpp"
#include "core/GameTypes.hpp"
#include "core/WinLossDrawResults.hpp"
#include "core/concepts/GameConcept.hpp"
#include "games/tictactoe/Constants.hpp"

#include <compare>
#include <type_traits>
#include <optional>
#include <ostream>
#include <string>

namespace tictactoe {

constexpr mask_t make_mask(int a, int b, int c) {
  return (mask_t(1) << a) + (mask_t(1) << b) + (mask_t(1) << c);
}

/*
 * Bit order encoding for the board, which is also the Move (cell index) encoding:
 *
 * 0 1 2
 * 3 4 5
 * 6 7 8
 *
 * X always moves first, so the player to move is determined by the number of occupied cells.
 */
class Game {
 public:
  struct Constants {
    static constexpr const char* kGameName = "tictactoe";
    static constexpr int kNumPlayers = tictactoe::kNumPlayers;
  };

  struct State {
    auto operator<=>(const State& other) const = default;
    mask_t opponent_mask() const { return full_mask ^ cur_player_mask; }
    mask_t x_mask() const;
    mask_t o_mask() const;

    // Returns kX, kO, or -1 for an empty cell.
    core::seat_index_t get_player_at(int row, int col) const;

    mask_t full_mask;        // spaces occupied by either player
    mask_t cur_player_mask;  // spaces occupied by the player whose turn it is
  };

  using Move = core::action_t;
  using GameResults = core::WinLossDrawResults;
  using Types = core::GameTypes<Constants, State, Move>;

  static_assert(std::is_same_v<Types::ValueArray, GameResults::ValueArray>);

  // Throws core::IllegalMoveError if (row, col) is off the board.
  static Move cell_index(int row, int col);

  struct Rules {
    static State starting_state();
    static std::optional<core::seat_index_t> active_player(const State&);
    static bool is_finished(const State&);
    static Types::MoveVector all_legal_moves(const State&);
    static bool is_legal_move(const State&, Move);
    static State make_move(const State&, Move);
    static std::optional<core::seat_index_t> winner(const State&);
    static std::optional<Types::ValueArray> evaluate(const State&);

    static bool is_winner(const State&, core::seat_index_t);
  };

  struct Keys {
    // One character per cell in row-major order: '_' (empty), 'X', or 'O'.
    static core::node_key_t node_key(const State&);
  };

  struct IO {
    static std::string move_to_str(Move move) { return std::to_string(move); }
    static std::string player_to_str(core::seat_index_t player) {
      return (player == tictactoe::kX) ? "X" : "O";
    }
    static void print_state(std::ostream&, const State&);
    static std::string state_repr(const State& state);
  };

  static constexpr mask_t kThreeInARowMasks[] = {
    make_mask(0, 1, 2), make_mask(3, 4, 5), make_mask(6, 7, 8), make_mask(0, 3, 6),
    make_mask(1, 4, 7), make_mask(2, 5, 8), make_mask(0, 4, 8), make_mask(2, 4, 6)};

  static constexpr mask_t kFullBoardMask = (mask_t(1) << kNumCells) - 1;
};

}  // namespace tictactoe

static_assert(core::concepts::Game<tictactoe::Game>);

#include "inline/games/tictactoe/Game.inl"
