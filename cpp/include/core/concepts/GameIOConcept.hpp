#pragma once

#include "core/BasicTypes.hpp"

#include <concepts>
#include <ostream>
#include <string>

namespace core {
namespace concepts {

template <typename GI, typename GameTypes>
concept GameIO = requires(std::ostream& ss, const typename GameTypes::State& state,
                          const typename GameTypes::Move& move) {
  { GI::move_to_str(move) } -> std::same_as<std::string>;
  { GI::player_to_str(core::seat_index_t{}) } -> std::same_as<std::string>;
  { GI::print_state(ss, state) };

  // state_repr is used by the search engine's debug output and by tests
  { GI::state_repr(state) } -> std::same_as<std::string>;
};

}  // namespace concepts
}  // namespace core
