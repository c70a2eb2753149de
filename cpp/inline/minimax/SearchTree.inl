#include "minimax/SearchTree.hpp"

#include "core/Exceptions.hpp"
#include "util/Asserts.hpp"
#include "util/LoggingUtil.hpp"

#include <algorithm>
#include <deque>

namespace minimax {

template <core::concepts::Game Game>
SearchTree<Game>::SearchTree(const State& state, std::unique_ptr<Scorer> scorer)
    : scorer_(std::move(scorer)) {
  reset(state);
}

template <core::concepts::Game Game>
void SearchTree<Game>::reset(const State& state) {
  table_.clear();
  Node root(state);
  current_key_ = root.node_key();
  AddResult result = table_.add_or_merge(std::move(root));
  RELEASE_ASSERT(result == kInserted, "root {} was already resident", current_key_);
}

template <core::concepts::Game Game>
bool SearchTree<Game>::expand_node(Node& node) {
  DEBUG_ASSERT(table_.get(node.node_key()) == &node, "node {} is not resident", node.node_key());
  typename Node::expansion_vec_t children = node.expand();

  key_vec_t merged_keys;
  for (auto& [move, child] : children) {
    core::node_key_t key = child.node_key();
    if (table_.add_or_merge(std::move(child)) == kMerged) {
      merged_keys.push_back(key);
    }
  }

  for (const core::node_key_t& key : merged_keys) {
    rescore_and_propagate(table_.at(key));
  }
  rescore_and_propagate(node);
  return !children.empty();
}

template <core::concepts::Game Game>
bool SearchTree<Game>::has_unexpanded_nodes() const {
  return std::any_of(table_.map().begin(), table_.map().end(),
                     [](const auto& item) { return !item.second.is_expanded(); });
}

template <core::concepts::Game Game>
typename SearchTree<Game>::key_vec_t SearchTree<Game>::unexpanded_keys() const {
  key_vec_t keys;
  for (const auto& [key, node] : table_.map()) {
    if (!node.is_expanded()) keys.push_back(key);
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

template <core::concepts::Game Game>
typename SearchTree<Game>::node_cptr_vec_t SearchTree<Game>::successor_nodes(
    const Node& node) const {
  node_cptr_vec_t nodes;
  for (const auto& [move, key] : node.successors()) {
    const Node* child = table_.get(key);
    if (child) nodes.push_back(child);
  }
  return nodes;
}

template <core::concepts::Game Game>
void SearchTree<Game>::advance(const Move& move) {
  const Node& current = current_node();
  if (!current.is_expanded()) {
    throw core::InvalidStateError("Cannot advance from unexpanded node {}", current_key_);
  }

  std::optional<core::node_key_t> key = current.successor_key(move);
  if (!key) {
    throw core::IllegalMoveError("Move {} is not legal in state:\n{}",
                                 Game::IO::move_to_str(move),
                                 Game::IO::state_repr(current.state()));
  }
  if (!table_.contains(*key)) {
    throw core::InvalidStateError("Successor {} of node {} is not in the transposition table",
                                  *key, current_key_);
  }
  current_key_ = *key;
}

template <core::concepts::Game Game>
void SearchTree<Game>::rescore_and_propagate(Node& node) {
  if (!scorer_->rescore(node, table_)) return;

  std::deque<core::node_key_t> queue{node.node_key()};
  while (!queue.empty()) {
    core::node_key_t key = std::move(queue.front());
    queue.pop_front();

    const Node* changed = table_.get(key);
    if (!changed) continue;
    for (const core::node_key_t& pred_key : changed->predecessors()) {
      Node* pred = table_.get(pred_key);
      if (pred && scorer_->rescore(*pred, table_)) {
        LOG_DEBUG("Score of {} changed via {}", pred_key, key);
        queue.push_back(pred_key);
      }
    }
  }
}

}  // namespace minimax
