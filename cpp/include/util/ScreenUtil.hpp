#pragma once

namespace util {

// Terminal width in columns, or 80 if stdout is not a terminal.
int get_screen_width();

}  // namespace util

#include "inline/util/ScreenUtil.inl"
