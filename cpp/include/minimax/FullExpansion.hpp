#pragma once

#include "core/concepts/GameConcept.hpp"
#include "minimax/ExpansionControl.hpp"

#include <memory>

namespace minimax {

/*
 * Steps the wrapped control until every resident node is expanded, or until the wrapped control
 * reports that it will not do more work.
 */
template <core::concepts::Game Game>
class FullExpansion : public ExpansionControl<Game> {
 public:
  using base_t = ExpansionControl<Game>;
  using SearchTree = base_t::SearchTree;

  explicit FullExpansion(std::unique_ptr<base_t> inner) : inner_(std::move(inner)) {}

  void begin_cycle(SearchTree& tree) override { inner_->begin_cycle(tree); }

  // Returns whether any inner step did work.
  bool step(SearchTree& tree) override;

  void end_cycle(SearchTree& tree) override { inner_->end_cycle(tree); }

 private:
  std::unique_ptr<base_t> inner_;
};

}  // namespace minimax

#include "inline/minimax/FullExpansion.inl"
