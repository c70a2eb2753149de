#include "minimax/TranspositionTable.hpp"

#include "core/Exceptions.hpp"

namespace minimax {

template <core::concepts::Game Game>
AddResult TranspositionTable<Game>::add_or_merge(Node&& node) {
  auto it = map_.find(node.node_key());
  if (it == map_.end()) {
    core::node_key_t key = node.node_key();
    map_.emplace(std::move(key), std::move(node));
    return kInserted;
  }

  it->second.merge(node);
  return kMerged;
}

template <core::concepts::Game Game>
typename TranspositionTable<Game>::Node* TranspositionTable<Game>::get(
    const core::node_key_t& key) {
  auto it = map_.find(key);
  return it == map_.end() ? nullptr : &it->second;
}

template <core::concepts::Game Game>
const typename TranspositionTable<Game>::Node* TranspositionTable<Game>::get(
    const core::node_key_t& key) const {
  auto it = map_.find(key);
  return it == map_.end() ? nullptr : &it->second;
}

template <core::concepts::Game Game>
typename TranspositionTable<Game>::Node& TranspositionTable<Game>::at(
    const core::node_key_t& key) {
  Node* node = get(key);
  if (!node) {
    throw core::InvalidStateError("Node {} is not in the transposition table", key);
  }
  return *node;
}

template <core::concepts::Game Game>
const typename TranspositionTable<Game>::Node& TranspositionTable<Game>::at(
    const core::node_key_t& key) const {
  const Node* node = get(key);
  if (!node) {
    throw core::InvalidStateError("Node {} is not in the transposition table", key);
  }
  return *node;
}

template <core::concepts::Game Game>
size_t TranspositionTable<Game>::retain(const key_set_t& keep) {
  size_t erased = std::erase_if(map_, [&](const auto& item) { return !keep.contains(item.first); });
  if (erased == 0) return 0;

  for (auto& [key, node] : map_) {
    node.remove_predecessors_if([&](const core::node_key_t& k) { return !keep.contains(k); });
  }
  return erased;
}

}  // namespace minimax
