#pragma once

#include "core/BasicTypes.hpp"

#include <concepts>
#include <optional>

namespace core {
namespace concepts {

template <typename GR, typename GameTypes>
concept GameRules = requires(const typename GameTypes::State& state,
                             const typename GameTypes::Move& move) {
  { GR::starting_state() } -> std::same_as<typename GameTypes::State>;

  // std::nullopt iff the state is terminal.
  { GR::active_player(state) } -> std::same_as<std::optional<core::seat_index_t>>;
  { GR::is_finished(state) } -> std::same_as<bool>;

  // Empty on finished states. The order of the returned moves is the order in which the search
  // engine lists successors.
  { GR::all_legal_moves(state) } -> std::same_as<typename GameTypes::MoveVector>;

  // Throws core::IllegalMoveError if move is not legal in state.
  { GR::make_move(state, move) } -> std::same_as<typename GameTypes::State>;

  // std::nullopt for a draw. Throws core::InvalidStateError if the state is not finished.
  { GR::winner(state) } -> std::same_as<std::optional<core::seat_index_t>>;

  // Zero-sum result of a finished state, std::nullopt if the state is not finished yet.
  { GR::evaluate(state) } -> std::same_as<std::optional<typename GameTypes::ValueArray>>;
};

}  // namespace concepts
}  // namespace core
