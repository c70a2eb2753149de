#include "minimax/Params.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace minimax {

inline auto Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Minimax options");

  return desc
    .template add_option<"time-limit", 't'>(po2::default_value("{:.3f}", &time_limit),
                                            "expansion time budget per move in seconds (0 means "
                                            "unlimited)")
    .template add_option<"node-limit", 'N'>(po::value<int>(&node_limit)->default_value(node_limit),
                                            "search tree size budget (0 means unlimited)")
    .template add_option<"search-depth", 'D'>(
      po::value<int>(&search_depth)->default_value(search_depth),
      "plies per forward sweep (--expansion sweep only)")
    .template add_option<"expansion", 'e'>(
      po::value<std::string>(&expansion)->default_value(expansion),
      "expansion strategy: current|one-step|sweep")
    .template add_option<"move-selector", 's'>(
      po::value<std::string>(&move_selector)->default_value(move_selector),
      "move selector: first|random|random-best")
    .template add_flag<"full-expansion", "no-full-expansion">(
      &full_expansion, "expand until the tree is fully expanded (or a budget is hit)",
      "only run the expansion strategy's own stopping rule")
    .template add_flag<"pruning", "no-pruning">(
      &pruning, "prune nodes unreachable from the current position after each move",
      "keep all nodes")
    .template add_flag<"debug", "no-debug">(
      &debug, "report board, tree size, plies expanded and pruning after each move",
      "no per-move report");
}

}  // namespace minimax
