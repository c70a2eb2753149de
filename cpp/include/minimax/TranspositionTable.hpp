#pragma once

#include "core/BasicTypes.hpp"
#include "core/concepts/GameConcept.hpp"
#include "minimax/Constants.hpp"
#include "minimax/SearchNode.hpp"

#include <cstddef>
#include <unordered_map>
#include <unordered_set>

namespace minimax {

/*
 * Maps node keys to the single resident SearchNode for that key. The table owns every node; all
 * other references to nodes are by key.
 *
 * Node references handed out by get()/at() remain valid across insertions, and are invalidated
 * only by retain() and clear() erasing the node they refer to.
 */
template <core::concepts::Game Game>
class TranspositionTable {
 public:
  using Node = SearchNode<Game>;
  using map_t = std::unordered_map<core::node_key_t, Node>;
  using key_set_t = std::unordered_set<core::node_key_t>;

  TranspositionTable() = default;
  TranspositionTable(const TranspositionTable&) = delete;
  TranspositionTable& operator=(const TranspositionTable&) = delete;

  /*
   * If node's key is not resident, inserts node and returns kInserted. Otherwise merges node into
   * the resident instance and returns kMerged.
   *
   * This is the only way nodes enter the table.
   */
  AddResult add_or_merge(Node&& node);

  // Returns nullptr if key is not resident.
  Node* get(const core::node_key_t& key);
  const Node* get(const core::node_key_t& key) const;

  // Throws core::InvalidStateError if key is not resident.
  Node& at(const core::node_key_t& key);
  const Node& at(const core::node_key_t& key) const;

  bool contains(const core::node_key_t& key) const { return map_.contains(key); }
  size_t size() const { return map_.size(); }
  const map_t& map() const { return map_; }

  void clear() { map_.clear(); }

  /*
   * Erases every node whose key is not in keep, and removes the erased keys from the predecessor
   * sets of the surviving nodes. Returns the number of erased nodes.
   */
  size_t retain(const key_set_t& keep);

 private:
  map_t map_;
};

}  // namespace minimax

#include "inline/minimax/TranspositionTable.inl"
