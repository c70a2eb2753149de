#pragma once

#include <cstdint>
#include <string>

namespace core {

using seat_index_t = int8_t;
using action_t = int32_t;

// Canonical identity of a game state within a search tree. Produced by Game::Keys::node_key().
using node_key_t = std::string;

}  // namespace core
