#pragma once

#include "core/BasicTypes.hpp"
#include "core/concepts/GameConstantsConcept.hpp"

#include <Eigen/Core>

#include <vector>

namespace core {

template <concepts::GameConstants GameConstants, typename State_, typename Move_>
struct GameTypes {
  using State = State_;
  using Move = Move_;
  static constexpr int kNumPlayers = GameConstants::kNumPlayers;

  // One value per seat. For zero-sum games, the entries sum to 0.
  using ValueArray = Eigen::Array<float, kNumPlayers, 1>;
  using MoveVector = std::vector<Move>;
};

}  // namespace core
