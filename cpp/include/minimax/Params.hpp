#pragma once

#include <string>

namespace minimax {

/*
 * Command-line configurable parameters of a minimax Driver. See DriverFactory for how they map to
 * the expansion chain.
 */
struct Params {
  auto make_options_description();

  // Throws util::CleanException on invalid values.
  void validate() const;

  double time_limit = 0;  // seconds, 0 means unlimited
  int node_limit = 0;     // 0 means unlimited
  int search_depth = 1;   // plies, only used with expansion == "sweep"
  std::string expansion = "current";
  bool full_expansion = false;
  std::string move_selector = "first";
  bool pruning = true;
  bool debug = false;
};

}  // namespace minimax

#include "inline/minimax/Params.inl"
