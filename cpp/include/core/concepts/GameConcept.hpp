#pragma once

#include "core/GameTypes.hpp"
#include "core/concepts/GameConstantsConcept.hpp"
#include "core/concepts/GameIOConcept.hpp"
#include "core/concepts/GameKeysConcept.hpp"
#include "core/concepts/GameRulesConcept.hpp"

#include <concepts>

namespace core {

namespace concepts {

/*
 * All Game classes G plugged into the minimax engine must satisfy core::concepts::Game<G>.
 *
 * The engine never mutates a G::State; it only copies states and passes them back to G::Rules.
 * The state graph induced by G::Rules::make_move() must be acyclic.
 */
template <class G>
concept Game = requires {
  requires core::concepts::GameConstants<typename G::Constants>;
  requires std::same_as<typename G::Types, core::GameTypes<typename G::Constants,
                                                           typename G::State, typename G::Move>>;

  requires std::copyable<typename G::State>;
  requires std::totally_ordered<typename G::Move>;
  requires std::copyable<typename G::Move>;

  requires core::concepts::GameRules<typename G::Rules, typename G::Types>;
  requires core::concepts::GameKeys<typename G::Keys, typename G::Types>;
  requires core::concepts::GameIO<typename G::IO, typename G::Types>;
};

}  // namespace concepts

}  // namespace core
