#pragma once

#include "core/BasicTypes.hpp"

#include <Eigen/Core>

namespace core {

/*
 * WinLossDrawResults maps the outcome of a finished 2-player game to a zero-sum ValueArray: the
 * winner gets kWinValue, the loser -kWinValue, and a draw gives both players 0.
 */
struct WinLossDrawResults {
  using ValueArray = Eigen::Array<float, 2, 1>;

  static constexpr float kWinValue = 1.0;

  static ValueArray draw() {
    ValueArray a;
    a.setZero();
    return a;
  }

  static ValueArray win(core::seat_index_t seat) {
    ValueArray a;
    a.setConstant(-kWinValue);
    a(seat) = kWinValue;
    return a;
  }
};

}  // namespace core
