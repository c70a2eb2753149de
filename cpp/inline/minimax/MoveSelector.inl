#include "minimax/MoveSelector.hpp"

#include "util/Random.hpp"

#include <algorithm>

namespace minimax {

template <core::concepts::Game Game>
typename MoveSelector<Game>::move_vec_t MoveSelector<Game>::candidates(const Node& node) {
  if (!node.best_moves().empty()) return node.best_moves();
  return Game::Rules::all_legal_moves(node.state());
}

template <core::concepts::Game Game>
std::optional<typename FirstMoveSelector<Game>::Move> FirstMoveSelector<Game>::select(
    const Node& node) {
  auto moves = this->candidates(node);
  if (moves.empty()) return std::nullopt;
  return *std::min_element(moves.begin(), moves.end());
}

template <core::concepts::Game Game>
std::optional<typename UniformRandomMoveSelector<Game>::Move>
UniformRandomMoveSelector<Game>::select(const Node& node) {
  auto moves = Game::Rules::all_legal_moves(node.state());
  if (moves.empty()) return std::nullopt;
  return util::Random::choose(moves.begin(), moves.end());
}

template <core::concepts::Game Game>
std::optional<typename RandomBestMoveSelector<Game>::Move> RandomBestMoveSelector<Game>::select(
    const Node& node) {
  auto moves = this->candidates(node);
  if (moves.empty()) return std::nullopt;
  return util::Random::choose(moves.begin(), moves.end());
}

}  // namespace minimax
