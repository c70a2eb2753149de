#pragma once

#include "core/concepts/GameConcept.hpp"
#include "minimax/DriverFactory.hpp"
#include "minimax/Params.hpp"

namespace minimax {

/*
 * Generic program entry point: parses minimax, logging and random options, builds a Driver via
 * DriverFactory, lets it play against itself until the game ends, and reports the result.
 *
 * Usage:
 *
 * int main(int ac, char* av[]) {
 *   minimax::Params defaults;
 *   ...
 *   return minimax::Main<MyGame>::main(ac, av, defaults);
 * }
 */
template <core::concepts::Game Game>
struct Main {
  using DriverFactory = minimax::DriverFactory<Game>;
  using Driver = DriverFactory::Driver;

  static int main(int ac, char* av[], const Params& default_params = Params());

  static void report_result(const Driver& driver);
};

}  // namespace minimax

#include "inline/minimax/Main.inl"
