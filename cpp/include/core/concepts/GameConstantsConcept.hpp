#pragma once

#include "util/CppUtil.hpp"

#include <concepts>

namespace core {
namespace concepts {

template <class GC>
concept GameConstants = requires {
  // The name of the game, used in logging and help output.
  { util::decay_copy(GC::kGameName) } -> std::same_as<const char*>;

  // kNumPlayers is the number of players in the game.
  { util::decay_copy(GC::kNumPlayers) } -> std::same_as<int>;
};

}  // namespace concepts
}  // namespace core
