#include "util/CppUtil.hpp"

#include <chrono>

namespace util {

inline double seconds_since(const std::chrono::steady_clock::time_point& start) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

}  // namespace util
