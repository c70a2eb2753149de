#include "minimax/BoundedExpansion.hpp"

#include "core/Exceptions.hpp"
#include "util/CppUtil.hpp"
#include "util/LoggingUtil.hpp"

namespace minimax {

template <core::concepts::Game Game>
BoundedExpansion<Game>::BoundedExpansion(std::unique_ptr<base_t> inner, double time_limit,
                                         size_t node_limit)
    : inner_(std::move(inner)),
      time_limit_(time_limit),
      node_limit_(node_limit),
      start_time_(clock_t::now()) {
  if (time_limit < 0) {
    throw core::InvalidStateError("BoundedExpansion: negative time limit {}", time_limit);
  }
}

template <core::concepts::Game Game>
void BoundedExpansion<Game>::begin_cycle(SearchTree& tree) {
  start_time_ = clock_t::now();
  inner_->begin_cycle(tree);
}

template <core::concepts::Game Game>
bool BoundedExpansion<Game>::step(SearchTree& tree) {
  bool expanded = inner_->step(tree);
  return expanded && !limit_exceeded(tree);
}

template <core::concepts::Game Game>
void BoundedExpansion<Game>::expand(SearchTree& tree) {
  int num_steps = 1;
  while (step(tree)) num_steps++;
  LOG_DEBUG("BoundedExpansion: {} steps, tree size {}, {:.3f}s elapsed", num_steps, tree.size(),
            util::seconds_since(start_time_));
}

template <core::concepts::Game Game>
bool BoundedExpansion<Game>::limit_exceeded(const SearchTree& tree) const {
  if (node_limit_ && tree.size() >= node_limit_) return true;
  if (time_limit_ > 0 && util::seconds_since(start_time_) >= time_limit_) return true;
  return false;
}

}  // namespace minimax
