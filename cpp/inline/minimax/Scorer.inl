#include "minimax/Scorer.hpp"

#include <optional>

namespace minimax {

template <core::concepts::Game Game>
bool MinimaxScorer<Game>::rescore(Node& node, const Table& table) const {
  using move_vec_t = Node::move_vec_t;

  if (node.is_terminal()) {
    return node.set_score(Game::Rules::evaluate(node.state()), {});
  }
  if (!node.is_expanded()) {
    return node.set_score(std::nullopt, {});
  }

  core::seat_index_t player = *node.active_player();
  const ValueArray neutral = neutral_value();
  bool any_scored = false;
  std::optional<ValueArray> best;
  move_vec_t best_moves;
  for (const auto& [move, key] : node.successors()) {
    const Node* child = table.get(key);
    if (!child) continue;

    // An unscored successor is an unfinished game: it ranks as neutral, above any known loss
    const ValueArray& value = child->has_score() ? *child->score() : neutral;
    any_scored |= child->has_score();
    if (!best || value(player) > (*best)(player)) {
      best = value;
      best_moves.clear();
      best_moves.push_back(move);
    } else if (value(player) == (*best)(player)) {
      best_moves.push_back(move);
    }
  }
  if (!any_scored) {
    return node.set_score(std::nullopt, {});
  }
  return node.set_score(best, best_moves);
}

}  // namespace minimax
