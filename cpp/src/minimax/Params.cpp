#include "minimax/Params.hpp"

#include "util/Asserts.hpp"

namespace minimax {

void Params::validate() const {
  CLEAN_ASSERT(time_limit >= 0, "Invalid --time-limit: {} (must be >= 0)", time_limit);
  CLEAN_ASSERT(node_limit >= 0, "Invalid --node-limit: {} (must be >= 0)", node_limit);
  CLEAN_ASSERT(expansion == "current" || expansion == "one-step" || expansion == "sweep",
               "Invalid --expansion: \"{}\" (expected current|one-step|sweep)", expansion);
  CLEAN_ASSERT(expansion != "sweep" || search_depth >= 1,
               "Invalid --search-depth: {} (must be >= 1)", search_depth);
  CLEAN_ASSERT(
    move_selector == "first" || move_selector == "random" || move_selector == "random-best",
    "Invalid --move-selector: \"{}\" (expected first|random|random-best)", move_selector);
}

}  // namespace minimax
