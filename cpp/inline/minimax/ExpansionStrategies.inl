#include "minimax/ExpansionStrategies.hpp"

namespace minimax {

template <core::concepts::Game Game>
bool CurrentNodeExpansion<Game>::step(SearchTree& tree) {
  auto& node = tree.current_node();
  if (node.is_expanded()) return false;
  return tree.expand_node(node);
}

template <core::concepts::Game Game>
bool OneStepExpansion<Game>::step(SearchTree& tree) {
  bool expanded = false;
  for (const core::node_key_t& key : tree.unexpanded_keys()) {
    auto& node = tree.table().at(key);
    if (node.is_expanded()) continue;
    expanded = tree.expand_node(node) || expanded;
  }
  return expanded;
}

}  // namespace minimax
