#include "minimax/ForwardSweepExpansion.hpp"

#include "core/Exceptions.hpp"
#include "util/LoggingUtil.hpp"

namespace minimax {

template <core::concepts::Game Game>
ForwardSweepExpansion<Game>::ForwardSweepExpansion(int search_depth, bool debug)
    : search_depth_(search_depth), debug_(debug) {
  if (search_depth < 1) {
    throw core::InvalidStateError("ForwardSweepExpansion: search depth must be >= 1 (got {})",
                                  search_depth);
  }
}

template <core::concepts::Game Game>
void ForwardSweepExpansion<Game>::begin_cycle(SearchTree& tree) {
  layer_ = 0;
  current_layer_ = {tree.current_key()};
  known_keys_ = {tree.current_key()};
}

template <core::concepts::Game Game>
bool ForwardSweepExpansion<Game>::step(SearchTree& tree) {
  if (layer_ >= search_depth_ || current_layer_.empty()) return false;

  key_vec_t next_layer;
  for (const core::node_key_t& key : current_layer_) {
    auto& node = tree.table().at(key);
    if (!node.is_expanded()) {
      tree.expand_node(node);
    }
    for (const auto& [move, succ_key] : node.successors()) {
      if (known_keys_.insert(succ_key).second) {
        next_layer.push_back(succ_key);
      }
    }
  }

  layer_++;
  current_layer_ = std::move(next_layer);
  return !current_layer_.empty() && layer_ < search_depth_;
}

template <core::concepts::Game Game>
void ForwardSweepExpansion<Game>::expand(SearchTree& tree) {
  while (step(tree)) {}
}

template <core::concepts::Game Game>
void ForwardSweepExpansion<Game>::end_cycle(SearchTree&) {
  if (debug_) {
    LOG_INFO("{} plies expanded.", layer_);
  }
}

}  // namespace minimax
