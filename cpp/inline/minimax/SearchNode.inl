#include "minimax/SearchNode.hpp"

#include "core/Exceptions.hpp"
#include "util/LoggingUtil.hpp"

#include <algorithm>

namespace minimax {

template <core::concepts::Game Game>
SearchNode<Game>::SearchNode(const State& state)
    : state_(state),
      key_(Game::Keys::node_key(state)),
      active_player_(Rules::active_player(state)),
      score_(Rules::evaluate(state)) {}

template <core::concepts::Game Game>
typename SearchNode<Game>::expansion_vec_t SearchNode<Game>::expand() {
  if (expanded_) {
    throw core::InvalidStateError("SearchNode::expand() called twice on node {}", key_);
  }

  expansion_vec_t out;
  for (const Move& move : Rules::all_legal_moves(state_)) {
    SearchNode child(Rules::make_move(state_, move));
    child.add_predecessor(key_);
    successors_.emplace_back(move, child.key_);
    out.emplace_back(move, std::move(child));
  }
  expanded_ = true;

  LOG_DEBUG("Expanded node {} ({} successors)", key_, successors_.size());
  return out;
}

template <core::concepts::Game Game>
bool SearchNode<Game>::merge(const SearchNode& other) {
  if (other.key_ != key_) {
    throw core::InvalidStateError("Cannot merge node {} into node {}", other.key_, key_);
  }
  if (&other == this) return false;

  bool changed = false;
  for (const successor_t& s : other.successors_) {
    auto it = std::find_if(successors_.begin(), successors_.end(),
                           [&](const successor_t& t) { return t.first == s.first; });
    if (it == successors_.end()) {
      successors_.push_back(s);
      changed = true;
    }
  }

  for (const core::node_key_t& k : other.predecessors_) {
    changed |= predecessors_.insert(k).second;
  }

  if (other.expanded_ && !expanded_) {
    expanded_ = true;
    changed = true;
  }
  return changed;
}

template <core::concepts::Game Game>
std::optional<core::node_key_t> SearchNode<Game>::successor_key(const Move& move) const {
  for (const successor_t& s : successors_) {
    if (s.first == move) return s.second;
  }
  return std::nullopt;
}

template <core::concepts::Game Game>
template <typename Pred>
int SearchNode<Game>::remove_predecessors_if(Pred pred) {
  return static_cast<int>(std::erase_if(predecessors_, pred));
}

template <core::concepts::Game Game>
std::optional<float> SearchNode<Game>::score(core::seat_index_t player) const {
  if (!score_) return std::nullopt;
  return (*score_)(player);
}

template <core::concepts::Game Game>
std::optional<typename SearchNode<Game>::Move> SearchNode<Game>::best_move() const {
  if (best_moves_.empty()) return std::nullopt;
  return best_moves_.front();
}

template <core::concepts::Game Game>
bool SearchNode<Game>::set_score(const std::optional<ValueArray>& score,
                                 const move_vec_t& best_moves) {
  best_moves_ = best_moves;
  if (same_score(score_, score)) return false;
  score_ = score;
  return true;
}

template <core::concepts::Game Game>
bool SearchNode<Game>::same_score(const std::optional<ValueArray>& a,
                                  const std::optional<ValueArray>& b) {
  if (a.has_value() != b.has_value()) return false;
  if (!a) return true;
  return (*a == *b).all();
}

}  // namespace minimax
