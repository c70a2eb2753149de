#include "minimax/FullExpansion.hpp"

#include "util/LoggingUtil.hpp"

namespace minimax {

template <core::concepts::Game Game>
bool FullExpansion<Game>::step(SearchTree& tree) {
  bool expanded = false;
  int num_steps = 0;
  while (tree.has_unexpanded_nodes()) {
    if (!inner_->step(tree)) break;
    expanded = true;
    num_steps++;
  }
  LOG_DEBUG("FullExpansion: {} steps, tree size {}", num_steps, tree.size());
  return expanded;
}

}  // namespace minimax
