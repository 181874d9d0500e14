#pragma once

namespace util {

// Clears the terminal attached to stdout. Throws util::Exception if the clear command fails.
void clearscreen();

// Width of the terminal attached to stdout, or kDefaultScreenWidth if stdout is not a terminal.
int get_screen_width();

constexpr int kDefaultScreenWidth = 80;

}  // namespace util

#include "inline/util/ScreenUtil.inl"
