#include "minimax/PruningPolicy.hpp"

#include "util/Asserts.hpp"
#include "util/LoggingUtil.hpp"

#include <vector>

namespace minimax {

template <core::concepts::Game Game>
size_t ReachabilityPruning<Game>::prune(SearchTree& tree) {
  size_t post_move_size = tree.size();
  size_t pruned = tree.table().retain(reachable_keys(tree));
  DEBUG_ASSERT(tree.table().contains(tree.current_key()), "pruned current node {}",
               tree.current_key());

  if (debug_) {
    LOG_INFO("Search tree size: {} (after move) - {} (pruned) = {}", post_move_size, pruned,
             tree.size());
  }
  return pruned;
}

template <core::concepts::Game Game>
typename ReachabilityPruning<Game>::key_set_t ReachabilityPruning<Game>::reachable_keys(
    const SearchTree& tree) {
  key_set_t closure{tree.current_key()};
  std::vector<core::node_key_t> frontier{tree.current_key()};

  while (!frontier.empty()) {
    core::node_key_t key = std::move(frontier.back());
    frontier.pop_back();

    const auto* node = tree.table().get(key);
    if (!node) continue;
    for (const auto& [move, succ_key] : node->successors()) {
      if (closure.insert(succ_key).second) {
        frontier.push_back(succ_key);
      }
    }
  }
  return closure;
}

}  // namespace minimax
