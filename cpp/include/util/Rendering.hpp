#pragma once

#include <cstdint>

namespace util {

/*
 * Rendering mode for text vs. terminal output.
 *
 * Rendering::mode() returns the current rendering mode, which by default is determined by
 * isatty(STDOUT_FILENO): kTerminal if true, kText otherwise. Board printing branches on this to
 * decide between colored circles and plain R/Y characters. Test binaries force kText via set().
 */
class Rendering {
 public:
  enum Mode : int8_t { kText, kTerminal };

  static Mode mode() { return instance().mode_; }
  static void set(Mode mode) { instance().mode_ = mode; }

 private:
  Rendering();
  static Rendering& instance();

  Mode mode_;
};

}  // namespace util

#include "inline/util/Rendering.inl"
