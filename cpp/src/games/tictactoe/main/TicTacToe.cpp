#include "games/tictactoe/Game.hpp"
#include "minimax/Main.hpp"
#include "minimax/Params.hpp"

// Self-play with a depth-5 forward sweep, capped at 100 nodes per move, choosing at random among
// the best moves and pruning after every move.
int main(int ac, char* av[]) {
  minimax::Params params;
  params.expansion = "sweep";
  params.search_depth = 5;
  params.node_limit = 100;
  params.move_selector = "random-best";
  params.pruning = true;

  return minimax::Main<tictactoe::Game>::main(ac, av, params);
}
