#pragma once

#include <cstdint>

namespace minimax {

// Outcome of TranspositionTable::add_or_merge()
enum AddResult : int8_t { kInserted, kMerged };

}  // namespace minimax
