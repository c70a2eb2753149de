#pragma once

#include "core/BasicTypes.hpp"

#include <concepts>

namespace core {
namespace concepts {

/*
 * GK::node_key(state) is the transposition identity of a state: two states must produce equal keys
 * iff they are the same position with the same player to move. It must be pure and total over all
 * reachable states.
 */
template <typename GK, typename GameTypes>
concept GameKeys = requires(const typename GameTypes::State& state) {
  { GK::node_key(state) } -> std::same_as<core::node_key_t>;
};

}  // namespace concepts
}  // namespace core
