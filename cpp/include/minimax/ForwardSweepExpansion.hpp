#pragma once

#include "core/BasicTypes.hpp"
#include "core/concepts/GameConcept.hpp"
#include "minimax/ExpansionControl.hpp"

#include <unordered_set>
#include <vector>

namespace minimax {

/*
 * Layered breadth-first expansion, search_depth plies deep from the current node.
 *
 * begin_cycle() makes the current node layer 0. Each step() expands every node of the current
 * layer that is not expanded yet; successors not seen before in this cycle form the next layer.
 * step() returns false once search_depth layers were processed or a layer yields no new nodes.
 *
 * Every cycle sweeps again from the current node, so nodes expanded in earlier cycles are walked
 * through but not re-expanded.
 *
 * Throws core::InvalidStateError if search_depth < 1.
 */
template <core::concepts::Game Game>
class ForwardSweepExpansion : public ExpansionControl<Game> {
 public:
  using SearchTree = ExpansionControl<Game>::SearchTree;
  using key_vec_t = std::vector<core::node_key_t>;
  using key_set_t = std::unordered_set<core::node_key_t>;

  // If debug is set, end_cycle() reports the number of plies expanded.
  explicit ForwardSweepExpansion(int search_depth, bool debug = false);

  void begin_cycle(SearchTree& tree) override;
  bool step(SearchTree& tree) override;
  void expand(SearchTree& tree) override;
  void end_cycle(SearchTree& tree) override;

  int search_depth() const { return search_depth_; }
  int plies_expanded() const { return layer_; }

 private:
  const int search_depth_;
  const bool debug_;

  int layer_ = 0;
  key_vec_t current_layer_;
  key_set_t known_keys_;
};

}  // namespace minimax

#include "inline/minimax/ForwardSweepExpansion.inl"
